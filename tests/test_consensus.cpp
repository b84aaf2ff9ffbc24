#include "reconcile/consensus.hpp"

#include <gtest/gtest.h>

using namespace statement_recon;
using namespace statement_recon::reconcile;

namespace {

extraction::PageExtraction pageWith(std::optional<int> cutoff,
                                    std::optional<std::string> issuer,
                                    std::optional<std::string> card) {
  extraction::PageExtraction page;
  page.cutoff_day = cutoff;
  page.issuer_name = issuer;
  page.card_name = card;
  return page;
}

}  // namespace

TEST(MostFrequentTest, PicksMajority) {
  EXPECT_EQ(mostFrequent(std::vector<int>{20, 20, 25}), 20);
  EXPECT_EQ(mostFrequent(std::vector<int>{25, 20, 20}), 20);
}

TEST(MostFrequentTest, EmptyInputHasNoValue) {
  EXPECT_FALSE(mostFrequent(std::vector<int>{}).has_value());
  EXPECT_FALSE(mostFrequent(std::vector<std::string>{}).has_value());
}

TEST(MostFrequentTest, TiesGoToFirstObserved) {
  EXPECT_EQ(mostFrequent(std::vector<std::string>{"A", "B"}), "A");
  EXPECT_EQ(mostFrequent(std::vector<std::string>{"B", "A", "A", "B"}), "B");
  // Not a numeric comparison
  EXPECT_EQ(mostFrequent(std::vector<int>{31, 5}), 31);
}

TEST(ConsensusTest, VotesEachFieldIndependently) {
  std::vector<extraction::PageExtraction> pages = {
    pageWith(20, "Kasikorn", std::nullopt),
    pageWith(std::nullopt, "Kasikorn", "Visa Platinum"),
    pageWith(25, "SCB", "Visa Platinum"),
    pageWith(20, std::nullopt, std::nullopt),
  };

  ConsensusResult result = aggregate(pages);
  EXPECT_EQ(result.cutoff_day, 20);
  EXPECT_EQ(result.issuer_name, "Kasikorn");
  EXPECT_EQ(result.card_name, "Visa Platinum");
  EXPECT_EQ(result.suggested_issuer, "Kasikorn Visa Platinum");
}

TEST(ConsensusTest, NothingObserved) {
  ConsensusResult result = aggregate({pageWith(std::nullopt, std::nullopt, std::nullopt)});
  EXPECT_FALSE(result.cutoff_day.has_value());
  EXPECT_FALSE(result.suggested_issuer.has_value());

  EXPECT_FALSE(aggregate({}).suggested_issuer.has_value());
}

TEST(ConsensusTest, SuggestionFallsBackToWhicheverNameIsKnown) {
  EXPECT_EQ(composeSuggestion(std::string("Kasikorn"), std::nullopt), "Kasikorn");
  EXPECT_EQ(composeSuggestion(std::nullopt, std::string("JCB Precious")), "JCB Precious");
  EXPECT_EQ(composeSuggestion(std::string(""), std::string("JCB Precious")), "JCB Precious");
  EXPECT_FALSE(composeSuggestion(std::nullopt, std::nullopt).has_value());
}

TEST(ConsensusTest, BatchVotesOverFiles) {
  ConsensusResult first;
  first.cutoff_day = 15;
  first.suggested_issuer = "Krungsri";
  ConsensusResult second;
  second.cutoff_day = 25;
  second.suggested_issuer = "Citi Rewards";
  ConsensusResult third;
  third.cutoff_day = 25;
  third.suggested_issuer = "Citi Rewards";
  ConsensusResult unknown;

  ConsensusResult batch = combine({first, second, unknown, third});
  EXPECT_EQ(batch.cutoff_day, 25);
  EXPECT_EQ(batch.suggested_issuer, "Citi Rewards");

  ConsensusResult tie = combine({first, second});
  EXPECT_EQ(tie.cutoff_day, 15);
  EXPECT_EQ(tie.suggested_issuer, "Krungsri");
}

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
