#include <gtest/gtest.h>
#include <langid/classifier/builtin_corpus.hpp>
#include <langid/classifier/ngram_classifier.hpp>

#include <algorithm>

using namespace langid;

class NgramClassifierTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto result = NgramClassifier::create(ClassifierConfig{});
        ASSERT_TRUE(result.ok()) << result.error().to_string();
        classifier_ = std::move(result.value());
    }

    std::string top_language(const std::string& text) {
        auto candidates = classifier_->classify(text, CancellationToken{});
        return candidates.empty() ? "" : candidates.front().language;
    }

    std::unique_ptr<NgramClassifier> classifier_;
};

TEST_F(NgramClassifierTest, LoadsBuiltinCorpus) {
    auto languages = classifier_->languages();
    EXPECT_EQ(languages.size(), builtin_corpus().size());
    EXPECT_NE(std::find(languages.begin(), languages.end(), "en"), languages.end());
    EXPECT_NE(std::find(languages.begin(), languages.end(), "pl"), languages.end());
    EXPECT_GT(classifier_->vocabulary_size(), 1000u);
}

TEST_F(NgramClassifierTest, ExtractNgrams) {
    // " ab " -> a, b, " a", ab, "b ", " ab", "ab "
    auto grams = NgramClassifier::extract_ngrams("Ab");
    ASSERT_EQ(grams.size(), 7u);
    EXPECT_EQ(grams[0], "a");
    EXPECT_EQ(grams[1], "b");
    EXPECT_NE(std::find(grams.begin(), grams.end(), " ab"), grams.end());

    // Digits and punctuation separate words and are not part of any n-gram
    EXPECT_TRUE(NgramClassifier::extract_ngrams("123 - 456").empty());
}

TEST_F(NgramClassifierTest, ExtractNgramsCountsCodePoints) {
    auto grams = NgramClassifier::extract_ngrams("żó");
    EXPECT_NE(std::find(grams.begin(), grams.end(), "żó"), grams.end());
    EXPECT_NE(std::find(grams.begin(), grams.end(), " żó"), grams.end());
}

TEST_F(NgramClassifierTest, ClassifiesClearSentences) {
    EXPECT_EQ(top_language("Please help me"), "en");
    EXPECT_EQ(top_language("The weather is very nice today and we are going for a walk"), "en");
    EXPECT_EQ(top_language("Wszyscy ludzie są równi i powinni żyć w zgodzie"), "pl");
    EXPECT_EQ(top_language("Ich möchte heute Abend mit meinen Freunden ins Kino gehen"), "de");
    EXPECT_EQ(top_language("Muchas gracias por tu ayuda, eres una persona muy amable"), "es");
    EXPECT_EQ(top_language("Все люди рождаются свободными и равными"), "ru");
}

TEST_F(NgramClassifierTest, CandidatesAreSortedAndBounded) {
    auto candidates = classifier_->classify(
        "The weather is very nice today and we are going for a walk", CancellationToken{});
    ASSERT_FALSE(candidates.empty());

    for (size_t i = 0; i < candidates.size(); ++i) {
        EXPECT_GT(candidates[i].probability, 0.1);
        EXPECT_LE(candidates[i].probability, 1.0);
        if (i > 0) {
            EXPECT_GE(candidates[i - 1].probability, candidates[i].probability);
        }
    }
}

TEST_F(NgramClassifierTest, Deterministic) {
    std::string text = "Dziękuję bardzo za pomoc, to było bardzo miłe";
    auto first = classifier_->classify(text, CancellationToken{});
    auto second = classifier_->classify(text, CancellationToken{});
    EXPECT_EQ(first, second);
}

TEST_F(NgramClassifierTest, NothingToClassify) {
    EXPECT_TRUE(classifier_->classify("", CancellationToken{}).empty());
    EXPECT_TRUE(classifier_->classify("12345 67890", CancellationToken{}).empty());
    EXPECT_TRUE(classifier_->classify("!!! ??? ...", CancellationToken{}).empty());
}

TEST_F(NgramClassifierTest, CancelledTokenStopsWork) {
    CancellationToken token;
    token.cancel();
    EXPECT_TRUE(classifier_->classify("Please help me find the station", token).empty());
}

TEST(NgramClassifierCreateTest, RestrictLanguages) {
    ClassifierConfig config;
    config.languages = {"en", "pl"};
    auto classifier = NgramClassifier::create(config);
    ASSERT_TRUE(classifier.ok());

    auto languages = classifier.value()->languages();
    ASSERT_EQ(languages.size(), 2u);
    EXPECT_EQ(languages[0], "en");
    EXPECT_EQ(languages[1], "pl");
}

TEST(NgramClassifierCreateTest, CustomProfile) {
    ClassifierConfig config;
    config.languages = {"en"};
    config.profiles["xq"] = {"zzqx qxzz xqzq zqxq", "qzzx xxqz zqqz"};
    auto created = NgramClassifier::create(config);
    ASSERT_TRUE(created.ok());

    auto& classifier = created.value();
    auto languages = classifier->languages();
    EXPECT_NE(std::find(languages.begin(), languages.end(), "xq"), languages.end());

    auto candidates = classifier->classify("zzqx xqzq qzzx", CancellationToken{});
    ASSERT_FALSE(candidates.empty());
    EXPECT_EQ(candidates.front().language, "xq");
}

TEST(NgramClassifierCreateTest, UnknownLanguage) {
    ClassifierConfig config;
    config.languages = {"en", "tlh"};
    auto classifier = NgramClassifier::create(config);
    ASSERT_FALSE(classifier.ok());
    EXPECT_EQ(classifier.error_code(), ErrorCode::INVALID_ARGUMENT);
}

TEST(NgramClassifierCreateTest, EmptyProfile) {
    ClassifierConfig config;
    config.profiles["xq"] = {};
    auto classifier = NgramClassifier::create(config);
    ASSERT_FALSE(classifier.ok());
    EXPECT_EQ(classifier.error_code(), ErrorCode::INVALID_ARGUMENT);
}
