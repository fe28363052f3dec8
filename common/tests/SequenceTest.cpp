#include <gtest/gtest.h>
#include <Sequence.hpp>
#include <memory>

TEST(SequenceTest, EmptySequenceHasNoElements) {
    Sequence<int> seq;
    EXPECT_TRUE(seq.begin() == seq.end());
    EXPECT_TRUE(seq.toVector().empty());
}

TEST(SequenceTest, IteratesSnapshotInOrder) {
    auto seq = Sequence<int>::fromVector({3, 1, 2});
    EXPECT_EQ(seq.toVector(), (std::vector<int>{3, 1, 2}));
}

TEST(SequenceTest, CanBeRestarted) {
    auto seq = Sequence<int>::fromVector({1, 2, 3});

    int firstSum = 0;
    for (int v : seq) {
        firstSum += v;
    }
    int secondSum = 0;
    for (int v : seq) {
        secondSum += v;
    }

    EXPECT_EQ(firstSum, 6);
    EXPECT_EQ(secondSum, 6);
}

TEST(SequenceTest, GeneratorIsPulledLazily) {
    auto pulls = std::make_shared<int>(0);
    Sequence<int> naturals([pulls]() {
        auto next = std::make_shared<int>(0);
        return Sequence<int>::Generator([pulls, next]() -> std::optional<int> {
            ++*pulls;
            if (*next >= 1000) {
                return std::nullopt;
            }
            return (*next)++;
        });
    });

    auto it = naturals.begin();
    ++it;
    ++it;

    EXPECT_EQ(*it, 2);
    EXPECT_EQ(*pulls, 3);
}

TEST(SequenceTest, FilterKeepsMatchingValues) {
    auto seq = Sequence<int>::fromVector({1, 2, 3, 4, 5, 6});
    auto even = seq.filter([](const int& v) { return v % 2 == 0; });

    EXPECT_EQ(even.toVector(), (std::vector<int>{2, 4, 6}));
    // Исходная последовательность не изменилась
    EXPECT_EQ(seq.toVector().size(), 6u);
}
