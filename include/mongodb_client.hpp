#pragma once

#include <functional>
#include <memory>
#include <string>

#include <mongocxx/client.hpp>
#include <mongocxx/collection.hpp>
#include <mongocxx/database.hpp>
#include <mongocxx/instance.hpp>

#include "config.hpp"

namespace summarizer {

struct Document {
    std::string url;
    std::string content;
};

class MongoDBClient {
public:
    explicit MongoDBClient(const DbConfig& config);
    ~MongoDBClient();

    bool connect();

    size_t count_documents();

    // limit == 0 reads the whole collection
    void for_each_document(std::function<void(const Document&)> callback,
                           size_t limit = 0);

private:
    DbConfig config_;
    std::unique_ptr<mongocxx::client> client_;
    mongocxx::database db_;
    mongocxx::collection collection_;

    std::string make_uri() const;
};

}
