#include <gtest/gtest.h>
#include "hierarchy/CandidateRanker.hpp"

#include <cmath>
#include <string>
#include <vector>

using namespace hierarchy;

class CandidateRankerTest : public ::testing::Test {
protected:
    // target along x; candidate scores are the cosine with x
    const Embedding target{1.0f, 0.0f};

    const Embedding v_09{0.9f, std::sqrt(1.0f - 0.81f)};
    const Embedding v_07{0.7f, std::sqrt(1.0f - 0.49f)};
    const Embedding v_05{0.5f, std::sqrt(1.0f - 0.25f)};
    const Embedding v_02{0.2f, std::sqrt(1.0f - 0.04f)};

    std::vector<Candidate> candidates() const {
        return {
            {"c05", &v_05, 0},
            {"c09", &v_09, 1},
            {"c02", &v_02, 2},
            {"c07", &v_07, 3},
        };
    }

    static std::vector<std::string> ids(const std::vector<RankedCandidate>& r) {
        std::vector<std::string> out;
        for (const auto& h : r) out.push_back(h.id);
        return out;
    }
};

TEST_F(CandidateRankerTest, OrdersByScoreDescending) {
    const auto ranked = rank_candidates(target, candidates(), 10, -1.0f);
    EXPECT_EQ(ids(ranked), (std::vector<std::string>{"c09", "c07", "c05", "c02"}));
    for (size_t i = 1; i < ranked.size(); ++i) {
        EXPECT_GE(ranked[i - 1].score, ranked[i].score);
    }
}

TEST_F(CandidateRankerTest, CarriesPayload) {
    const auto ranked = rank_candidates(target, candidates(), 1, 0.0f);
    ASSERT_EQ(ranked.size(), 1u);
    EXPECT_EQ(ranked[0].id, "c09");
    EXPECT_EQ(ranked[0].payload, 1u);
    EXPECT_NEAR(ranked[0].score, 0.9f, 1e-5f);
}

TEST_F(CandidateRankerTest, AppliesThresholdInclusively) {
    const auto ranked = rank_candidates(target, candidates(), 10, 0.5f - 1e-6f);
    EXPECT_EQ(ids(ranked), (std::vector<std::string>{"c09", "c07", "c05"}));
    for (const auto& h : ranked) EXPECT_GE(h.score, 0.5f - 1e-6f);
}

TEST_F(CandidateRankerTest, TruncatesToTopN) {
    const auto ranked = rank_candidates(target, candidates(), 2, 0.0f);
    EXPECT_EQ(ids(ranked), (std::vector<std::string>{"c09", "c07"}));
}

TEST_F(CandidateRankerTest, TopNZeroIsEmpty) {
    EXPECT_TRUE(rank_candidates(target, candidates(), 0, -1.0f).empty());
}

TEST_F(CandidateRankerTest, NothingAboveThresholdIsEmpty) {
    EXPECT_TRUE(rank_candidates(target, candidates(), 3, 0.95f).empty());
}

TEST_F(CandidateRankerTest, EqualScoresKeepCandidateOrder) {
    const Embedding same{0.6f, 0.8f};
    const std::vector<Candidate> c{
        {"first", &same, 0},
        {"better", &v_09, 1},
        {"second", &same, 2},
        {"third", &same, 3},
    };
    const auto ranked = rank_candidates(target, c, 10, 0.0f);
    EXPECT_EQ(ids(ranked), (std::vector<std::string>{"better", "first", "second", "third"}));

    // repeated runs are identical
    EXPECT_EQ(ids(rank_candidates(target, c, 10, 0.0f)), ids(ranked));
}

TEST_F(CandidateRankerTest, AbsentCandidateScoresZero) {
    const std::vector<Candidate> c{
        {"missing", nullptr, 0},
        {"present", &target, 1},
    };
    const Embedding none;
    const std::vector<Candidate> c2{{"blank", &none, 0}};

    const auto ranked = rank_candidates(target, c, 10, 0.0f);
    ASSERT_EQ(ranked.size(), 2u);
    EXPECT_EQ(ranked[0].id, "present");
    EXPECT_EQ(ranked[1].id, "missing");
    EXPECT_EQ(ranked[1].score, 0.0f);

    EXPECT_TRUE(rank_candidates(target, c2, 10, 0.1f).empty());
}

TEST_F(CandidateRankerTest, MalformedCandidateIsSkippedWithDiagnostic) {
    const Embedding bad{1.0f, 0.0f, 0.0f};
    const std::vector<Candidate> c{
        {"c09", &v_09, 0},
        {"bad", &bad, 1},
        {"c07", &v_07, 2},
    };

    std::vector<Diagnostic> diags;
    const auto ranked = rank_candidates(target, c, 10, 0.0f, &diags);
    EXPECT_EQ(ids(ranked), (std::vector<std::string>{"c09", "c07"}));
    ASSERT_EQ(diags.size(), 1u);
    EXPECT_EQ(diags[0].code, "candidate_skipped");
    EXPECT_NE(diags[0].message.find("bad"), std::string::npos);

    // no sink: still skipped, no throw
    EXPECT_EQ(rank_candidates(target, c, 10, 0.0f).size(), 2u);
}

TEST_F(CandidateRankerTest, DoesNotMutateCandidates) {
    const auto before = candidates();
    auto c = before;
    (void)rank_candidates(target, c, 2, 0.5f);
    ASSERT_EQ(c.size(), before.size());
    for (size_t i = 0; i < c.size(); ++i) {
        EXPECT_EQ(c[i].id, before[i].id);
        EXPECT_EQ(c[i].vector, before[i].vector);
        EXPECT_EQ(c[i].payload, before[i].payload);
    }
}
