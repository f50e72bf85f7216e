#include "summarizer.hpp"
#include "text_utils.hpp"
#include <gtest/gtest.h>

#include <algorithm>
#include <limits>
#include <numeric>

using namespace summarizer;

namespace {

const std::string CLIMATE_TEXT =
    "The climate crisis threatens coastal cities across the whole world today. "
    "Fish markets close early on weekends in the small harbor town nearby. "
    "Coastal cities face rising seas and climate crisis risk every single year now.";

const std::string STOPWORD_TEXT =
    "It is what it is, and we are all in it. "
    "You and I do not do what they do. "
    "We can, we should, and we will do it. "
    "If it is so, then it is so for all of us. "
    "He and she, his and her, they and their own. "
    "Is it this or that, or is it both of those?";

const std::string RIVER_TEXT =
    "Rivers flood. "
    "Rivers flood often and rivers flood hard during the rainy season in spring. "
    "Farmers plant rice near the delta where rivers deposit fertile soil each year. "
    "Rivers flood. Rivers flood. "
    "Local markets sell vegetables grown by farmers from the surrounding villages.";

const std::string ARABIC_SHORT =
    "ذهب الولد إلى المدرسة. قرأ الكتاب في الصباح. ثم عاد إلى البيت. وتناول الغداء مع أسرته.";

const std::string ARABIC_LONG =
    "تعتمد الزراعة في المنطقة على مياه النهر بشكل كبير جدا. "
    "يزرع الفلاحون القمح والشعير على ضفاف النهر كل عام. "
    "تقام في المدينة سوق أسبوعية لبيع الملابس والأحذية. "
    "يؤدي فيضان النهر إلى تغذية التربة ويساعد الزراعة والفلاحون على زيادة المحصول؟ "
    "يحب الأطفال اللعب في الحديقة العامة مساء.";

std::vector<size_t> all_indices(size_t n) {
    std::vector<size_t> indices(n);
    std::iota(indices.begin(), indices.end(), size_t(0));
    return indices;
}

bool strictly_ascending(const std::vector<size_t>& v) {
    for (size_t i = 1; i < v.size(); ++i) {
        if (v[i - 1] >= v[i]) return false;
    }
    return true;
}

}

TEST(Summarizer, EmptyInput) {
    Summarizer summarizer;

    auto result = summarizer.summarize(std::string());
    EXPECT_EQ(result.summary, "");
    EXPECT_EQ(result.language_code(), "en");
    EXPECT_TRUE(result.selected_indices.empty());
    EXPECT_EQ(result.sentences_count, 0u);
}

TEST(Summarizer, NullInput) {
    Summarizer summarizer;

    auto result = summarizer.summarize(static_cast<const char*>(nullptr));
    EXPECT_EQ(result.summary, "");
    EXPECT_EQ(result.language_code(), "en");
    EXPECT_TRUE(result.selected_indices.empty());
    EXPECT_EQ(result.sentences_count, 0u);
}

TEST(Summarizer, WhitespaceOnlyInput) {
    Summarizer summarizer;

    auto result = summarizer.summarize(" \n\t  \n");
    EXPECT_EQ(result.summary, "");
    EXPECT_TRUE(result.selected_indices.empty());
    EXPECT_EQ(result.sentences_count, 0u);
}

TEST(Summarizer, ShortTextReturnedWhole) {
    Summarizer summarizer;
    std::string text = "  First sentence here.\n\nSecond one follows!   Third is short.  ";

    auto result = summarizer.summarize(text);
    EXPECT_EQ(result.summary, normalize_whitespace(text));
    EXPECT_EQ(result.sentences_count, 3u);
    EXPECT_EQ(result.selected_indices, all_indices(3));
}

TEST(Summarizer, TwoLongSentencesReturnedWhole) {
    Summarizer summarizer;
    std::string text =
        "This opening sentence is deliberately written to be quite long so that the "
        "document as a whole passes the two hundred character mark without trouble. "
        "The closing sentence then adds even more words about nothing in particular at all.";

    ASSERT_GE(utf8_length(text), SHORT_DOCUMENT_LENGTH);

    auto result = summarizer.summarize(text);
    EXPECT_EQ(result.summary, text);
    EXPECT_EQ(result.sentences_count, 2u);
    EXPECT_EQ(result.selected_indices, all_indices(2));
}

TEST(Summarizer, ArabicShortText) {
    Summarizer summarizer;

    auto result = summarizer.summarize(ARABIC_SHORT);
    EXPECT_EQ(result.language, Language::ARABIC);
    EXPECT_EQ(result.summary, ARABIC_SHORT);
    EXPECT_EQ(result.sentences_count, 4u);
    EXPECT_EQ(result.selected_indices, all_indices(4));
}

TEST(Summarizer, PicksSentencesWithRepeatedTerms) {
    Summarizer summarizer;
    ASSERT_GE(utf8_length(CLIMATE_TEXT), SHORT_DOCUMENT_LENGTH);

    SummaryOptions options;
    options.max_sentences = 2;
    options.ratio = 1.0;

    auto result = summarizer.summarize(CLIMATE_TEXT, options);
    EXPECT_EQ(result.language_code(), "en");
    EXPECT_EQ(result.sentences_count, 3u);
    EXPECT_EQ(result.selected_indices, (std::vector<size_t>{0, 2}));
    EXPECT_EQ(result.summary,
              "The climate crisis threatens coastal cities across the whole world today. "
              "Coastal cities face rising seas and climate crisis risk every single year now.");
    EXPECT_EQ(result.summary.find("Fish"), std::string::npos);
}

TEST(Summarizer, StopwordOnlyTextFallsBackToLeadingSentences) {
    Summarizer summarizer;
    ASSERT_GE(utf8_length(STOPWORD_TEXT), SHORT_DOCUMENT_LENGTH);
    EXPECT_TRUE(summarizer.term_frequencies(STOPWORD_TEXT).empty());

    // 6 sentences at ratio 0.25 round up to 2
    auto result = summarizer.summarize(STOPWORD_TEXT);
    EXPECT_EQ(result.sentences_count, 6u);
    EXPECT_EQ(result.selected_indices, (std::vector<size_t>{0, 1}));
    EXPECT_EQ(result.summary, "It is what it is, and we are all in it. You and I do not do what they do.");
}

TEST(Summarizer, ShortSentencesAreNotRanked) {
    Summarizer summarizer;
    SummaryOptions options;
    options.max_sentences = 2;
    options.ratio = 1.0;

    auto result = summarizer.summarize(RIVER_TEXT, options);
    EXPECT_EQ(result.sentences_count, 6u);
    EXPECT_EQ(result.selected_indices, (std::vector<size_t>{1, 2}));
}

TEST(Summarizer, EqualScoresPreferEarlierSentences) {
    Summarizer summarizer;
    SummaryOptions options;
    options.max_sentences = 2;
    options.ratio = 1.0;
    options.min_sentence_len = 0;

    // "Rivers flood." appears three times with the top score
    auto result = summarizer.summarize(RIVER_TEXT, options);
    EXPECT_EQ(result.selected_indices, (std::vector<size_t>{0, 3}));
    EXPECT_EQ(result.summary, "Rivers flood. Rivers flood.");
}

TEST(Summarizer, NoEligibleSentenceFallsBack) {
    Summarizer summarizer;
    SummaryOptions options;
    options.max_sentences = 2;
    options.ratio = 1.0;
    options.min_sentence_len = 500;

    auto result = summarizer.summarize(RIVER_TEXT, options);
    EXPECT_EQ(result.selected_indices, (std::vector<size_t>{0, 1}));
    EXPECT_EQ(result.summary,
              "Rivers flood. Rivers flood often and rivers flood hard during the rainy season in spring.");
}

TEST(Summarizer, ArabicFullPipeline) {
    Summarizer summarizer;

    auto result = summarizer.summarize(ARABIC_LONG);
    EXPECT_EQ(result.language_code(), "ar");
    EXPECT_EQ(result.sentences_count, 5u);
    EXPECT_EQ(result.selected_indices, (std::vector<size_t>{0, 3}));
    EXPECT_EQ(result.summary,
              "تعتمد الزراعة في المنطقة على مياه النهر بشكل كبير جدا. "
              "يؤدي فيضان النهر إلى تغذية التربة ويساعد الزراعة والفلاحون على زيادة المحصول؟");
}

TEST(Summarizer, SelectionBoundsAndOrder) {
    Summarizer summarizer;
    const std::string* texts[] = {&CLIMATE_TEXT, &STOPWORD_TEXT, &RIVER_TEXT, &ARABIC_LONG};

    for (int max_sentences : {1, 2, 3, 10}) {
        for (double ratio : {0.1, 0.25, 0.5, 1.0}) {
            SummaryOptions options;
            options.max_sentences = max_sentences;
            options.ratio = ratio;

            for (const auto* text : texts) {
                auto result = summarizer.summarize(*text, options);
                size_t upper = std::min<size_t>(max_sentences, result.sentences_count);

                EXPECT_GE(result.selected_indices.size(), 1u);
                EXPECT_LE(result.selected_indices.size(), upper);
                EXPECT_TRUE(strictly_ascending(result.selected_indices));
                EXPECT_LT(result.selected_indices.back(), result.sentences_count);
            }
        }
    }
}

TEST(Summarizer, MalformedOptionsAreClamped) {
    Summarizer summarizer;
    SummaryOptions options;
    options.max_sentences = 0;
    options.ratio = -1.0;
    options.min_sentence_len = -5;

    auto result = summarizer.summarize(CLIMATE_TEXT, options);
    EXPECT_EQ(result.selected_indices.size(), 1u);
}

TEST(Summarizer, TargetSentenceCount) {
    SummaryOptions options;
    EXPECT_EQ(Summarizer::target_sentence_count(3, options), 1u);
    EXPECT_EQ(Summarizer::target_sentence_count(4, options), 1u);
    EXPECT_EQ(Summarizer::target_sentence_count(5, options), 2u);
    EXPECT_EQ(Summarizer::target_sentence_count(100, options), 3u);

    options.ratio = 0.1;
    EXPECT_EQ(Summarizer::target_sentence_count(30, options), 3u);

    options.max_sentences = 10;
    options.ratio = 5.0;
    EXPECT_EQ(Summarizer::target_sentence_count(4, options), 4u);

    options.max_sentences = -3;
    EXPECT_EQ(Summarizer::target_sentence_count(4, options), 1u);

    options.max_sentences = 3;
    options.ratio = 0.0;
    EXPECT_EQ(Summarizer::target_sentence_count(4, options), 1u);
}

TEST(Summarizer, HugeRatioIsCappedAtSentenceCount) {
    SummaryOptions options;
    options.max_sentences = 2;
    options.ratio = 1e30;
    EXPECT_EQ(Summarizer::target_sentence_count(10, options), 2u);

    options.max_sentences = 50;
    EXPECT_EQ(Summarizer::target_sentence_count(10, options), 10u);

    options.ratio = std::numeric_limits<double>::infinity();
    EXPECT_EQ(Summarizer::target_sentence_count(10, options), 10u);
    options.max_sentences = 4;
    EXPECT_EQ(Summarizer::target_sentence_count(10, options), 4u);

    options.ratio = std::numeric_limits<double>::quiet_NaN();
    EXPECT_EQ(Summarizer::target_sentence_count(10, options), 1u);
}

TEST(Summarizer, DefaultConstructedUsesBuiltInStopwords) {
    Summarizer summarizer;
    EXPECT_EQ(summarizer.stopwords(Language::ARABIC).size(),
              default_stopwords(Language::ARABIC).size());

    auto result = summarizer.summarize(CLIMATE_TEXT);
    EXPECT_FALSE(result.summary.empty());
}

TEST(Summarizer, LanguageFollowsScript) {
    Summarizer summarizer;
    EXPECT_EQ(summarizer.summarize("Plain English words.").language, Language::ENGLISH);
    EXPECT_EQ(summarizer.summarize("English with a word مرحبا inside.").language, Language::ARABIC);
    EXPECT_EQ(summarizer.summarize("...").language, Language::ENGLISH);
}

TEST(Summarizer, CustomStopwordsOverrideOneLanguage) {
    Summarizer::Config config;
    config.stopwords_en = StopwordSet{"climate", "crisis", "coastal", "cities"};
    Summarizer summarizer(config);

    EXPECT_EQ(summarizer.stopwords(Language::ENGLISH).size(), 4u);
    EXPECT_EQ(summarizer.stopwords(Language::ARABIC).size(),
              default_stopwords(Language::ARABIC).size());

    // Without its salient terms the climate text no longer ranks sentence 2 first
    SummaryOptions options;
    options.max_sentences = 1;
    options.ratio = 1.0;
    auto result = summarizer.summarize(CLIMATE_TEXT, options);
    EXPECT_EQ(result.selected_indices.size(), 1u);
}

TEST(Summarizer, DefaultsUntouchedByOverride) {
    Summarizer::Config config;
    config.stopwords_en = StopwordSet{};
    Summarizer custom(config);
    Summarizer standard;

    EXPECT_TRUE(custom.stopwords(Language::ENGLISH).empty());
    EXPECT_EQ(standard.stopwords(Language::ENGLISH).size(),
              default_stopwords(Language::ENGLISH).size());
    EXPECT_EQ(standard.stopwords(Language::ENGLISH).count("the"), 1u);
}
