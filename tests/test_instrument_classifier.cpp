#include <gtest/gtest.h>
#include "issfeed/symbol/instrument_classifier.hpp"
#include <string>
#include <vector>

using namespace issfeed::symbol;

TEST(InstrumentClassifierTest, AcceptsAllowListedAndSuffixedSymbols) {
    InstrumentClassifier classifier;

    EXPECT_TRUE(classifier.is_eligible("SBER"));
    EXPECT_TRUE(classifier.is_eligible("gazp"));
    EXPECT_TRUE(classifier.is_eligible("LKOH.ME"));
    EXPECT_TRUE(classifier.is_eligible("ABCD.ME"));
    EXPECT_TRUE(classifier.is_eligible("xyz.MOEX"));

    EXPECT_FALSE(classifier.is_eligible("AAPL"));
    EXPECT_FALSE(classifier.is_eligible("BTC-USD"));
    EXPECT_FALSE(classifier.is_eligible(""));
    EXPECT_FALSE(classifier.is_eligible(".ME"));
}

TEST(InstrumentClassifierTest, SuffixTagIsCaseSensitive) {
    InstrumentClassifier classifier;

    EXPECT_FALSE(classifier.is_eligible("xyz.me"));
    EXPECT_FALSE(classifier.is_eligible("ABCD.Me"));
    EXPECT_FALSE(classifier.is_eligible("xyz.moex"));

    // allow-listed tickers still match through the canonical form
    EXPECT_TRUE(classifier.is_eligible("sber.me"));
    EXPECT_TRUE(classifier.is_eligible("Lkoh.moex"));
}

TEST(InstrumentClassifierTest, CanonicalizeStripsOneSuffixAndUppercases) {
    EXPECT_EQ(InstrumentClassifier::canonicalize("sber"), "SBER");
    EXPECT_EQ(InstrumentClassifier::canonicalize("Sber.me"), "SBER");
    EXPECT_EQ(InstrumentClassifier::canonicalize("MOEX.MOEX"), "MOEX");
    EXPECT_EQ(InstrumentClassifier::canonicalize("ME.ME"), "ME");
    EXPECT_EQ(InstrumentClassifier::canonicalize("AAPL"), "AAPL");
}

TEST(InstrumentClassifierTest, ExtraTickersExtendTheAllowList) {
    InstrumentClassifier classifier(std::vector<std::string>{"ydex", "T.ME"});

    EXPECT_TRUE(classifier.is_eligible("YDEX"));
    EXPECT_TRUE(classifier.is_eligible("t"));
    EXPECT_TRUE(classifier.is_eligible("SBER"));
    EXPECT_EQ(classifier.tickers().size(), InstrumentClassifier::DEFAULT_TICKERS.size() + 2);
}

TEST(InstrumentClassifierTest, DefaultListCoversKnownTickers) {
    EXPECT_EQ(InstrumentClassifier::DEFAULT_TICKERS.size(), 54u);
    EXPECT_EQ(InstrumentClassifier::DEFAULT_TICKERS.count("SBERP"), 1u);
    EXPECT_EQ(InstrumentClassifier::DEFAULT_TICKERS.count("AQUA"), 1u);
}
