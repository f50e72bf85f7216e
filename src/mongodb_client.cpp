#include "mongodb_client.hpp"

#include <bsoncxx/builder/basic/document.hpp>
#include <bsoncxx/builder/basic/kvp.hpp>
#include <bsoncxx/types.hpp>
#include <mongocxx/options/find.hpp>
#include <mongocxx/uri.hpp>

#include <iostream>

namespace summarizer {

MongoDBClient::MongoDBClient(const DbConfig& config) : config_(config) {
    // mongocxx allows one instance per process
    static mongocxx::instance instance{};
}

MongoDBClient::~MongoDBClient() = default;

std::string MongoDBClient::make_uri() const {
    if (!config_.username.empty() && !config_.password.empty()) {
        return "mongodb://" + config_.username + ":" + config_.password + "@" +
               config_.host + ":" + std::to_string(config_.port);
    }
    return "mongodb://" + config_.host + ":" + std::to_string(config_.port);
}

bool MongoDBClient::connect() {
    if (config_.database.empty() || config_.collection.empty()) {
        std::cerr << "MongoDB database and collection must be set in the config" << std::endl;
        return false;
    }

    try {
        mongocxx::uri uri(make_uri());
        client_ = std::make_unique<mongocxx::client>(uri);

        db_ = (*client_)[config_.database];
        collection_ = db_[config_.collection];

        std::cout << "Connected to MongoDB: " << config_.host << ":" << config_.port << std::endl;
        std::cout << "  Database: " << config_.database
                  << ", collection: " << config_.collection << std::endl;

        return true;
    } catch (const std::exception& e) {
        std::cerr << "MongoDB connection error: " << e.what() << std::endl;
        return false;
    }
}

size_t MongoDBClient::count_documents() {
    return static_cast<size_t>(collection_.count_documents({}));
}

void MongoDBClient::for_each_document(
    std::function<void(const Document&)> callback,
    size_t limit
) {
    using bsoncxx::builder::basic::kvp;
    using bsoncxx::builder::basic::make_document;

    mongocxx::options::find opts;
    opts.projection(make_document(
        kvp("url", 1),
        kvp(config_.text_field, 1)
    ));

    if (limit > 0) {
        opts.limit(static_cast<int64_t>(limit));
    }

    auto cursor = collection_.find({}, opts);

    for (auto&& doc : cursor) {
        Document document;

        auto url = doc["url"];
        if (url && url.type() == bsoncxx::type::k_string) {
            auto url_view = url.get_string().value;
            document.url = std::string(url_view.data(), url_view.length());
        }

        auto content = doc[config_.text_field];
        if (content && content.type() == bsoncxx::type::k_string) {
            auto content_view = content.get_string().value;
            document.content = std::string(content_view.data(), content_view.length());
        }

        callback(document);
    }
}

}
