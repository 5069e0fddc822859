#include "lcg_crack.hpp"
#include <gtest/gtest.h>

namespace {

const cpp_int kModulus = 479001599;

std::vector<cpp_int> observed(LCG gen, size_t n) {
    return gen.take(n);
}

std::vector<cpp_int> reference_sequence(size_t n) {
    return observed(LCG(32760, 5039, 0, kModulus), n);
}

}  // namespace

TEST(RecoverModulus, ConvergesOnTenSamples) {
    EXPECT_EQ(recover_modulus(reference_sequence(10)), kModulus);
}

TEST(RecoverModulus, NoCandidateBelowFourSamples) {
    EXPECT_EQ(recover_modulus(reference_sequence(3)), 0);
}

TEST(CrackLcg, RecoversKnownParameters) {
    std::vector<cpp_int> values = reference_sequence(10);
    ASSERT_EQ(values.front(), 32760);
    ASSERT_EQ(values[1], 165077640);

    CrackFailure why = CrackFailure::inconsistent_sequence;
    std::optional<LCG> cracked = crack_lcg(values, &why);
    ASSERT_TRUE(cracked.has_value());
    EXPECT_EQ(why, CrackFailure::none);
    EXPECT_EQ(cracked->a, 5039);
    EXPECT_EQ(cracked->c, 0);
    EXPECT_EQ(cracked->m, kModulus);
    EXPECT_EQ(cracked->state, values.back());
    EXPECT_EQ(cracked->state, 398422511);
}

TEST(CrackLcg, CrackedGeneratorContinuesSequence) {
    LCG source(32760, 5039, 0, kModulus);
    std::vector<cpp_int> values = source.take(10);
    std::optional<LCG> cracked = crack_lcg(values);
    ASSERT_TRUE(cracked.has_value());

    // next() first repeats the last observation, then runs in step with the source
    EXPECT_EQ(cracked->next(), values.back());
    EXPECT_EQ(cracked->take(20), source.take(20));
}

TEST(CrackLcg, DiscardOneYieldsFirstUnseenValue) {
    std::vector<cpp_int> values = reference_sequence(10);
    std::optional<LCG> cracked = crack_lcg(values);
    ASSERT_TRUE(cracked.has_value());
    EXPECT_EQ(cracked->state, 398422511);
    cracked->discard(1);
    EXPECT_EQ(cracked->next(), 155331520);
}

TEST(CrackLcg, CrackingOwnOutputIsIdempotent) {
    std::optional<LCG> first = crack_lcg(reference_sequence(10));
    ASSERT_TRUE(first.has_value());

    LCG replay = *first;
    std::vector<cpp_int> more = replay.take(10);
    EXPECT_EQ(more[1], 155331520);

    std::optional<LCG> second = crack_lcg(more);
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(second->a, first->a);
    EXPECT_EQ(second->c, first->c);
    EXPECT_EQ(second->m, first->m);
    EXPECT_EQ(second->state, 41528956);
}

TEST(CrackLcg, RecoversNonZeroIncrementAndLargeModulus) {
    cpp_int m = (cpp_int(1) << 61) - 1;
    LCG source(123456789, cpp_int("25214903917"), 11, m);
    std::vector<cpp_int> values = source.take(12);

    std::optional<LCG> cracked = crack_lcg(values);
    ASSERT_TRUE(cracked.has_value());
    EXPECT_EQ(cracked->a, cpp_int("25214903917"));
    EXPECT_EQ(cracked->c, 11);
    EXPECT_EQ(cracked->m, m);
}

TEST(CrackLcg, PreviousValuesFromCrackedParameters) {
    std::vector<cpp_int> values = reference_sequence(10);
    std::optional<LCG> cracked = crack_lcg(values);
    ASSERT_TRUE(cracked.has_value());

    for (size_t i = values.size() - 1; i-- > 0; ) {
        std::optional<cpp_int> v = cracked->prev();
        ASSERT_TRUE(v.has_value());
        EXPECT_EQ(*v, values[i]);
    }
}

TEST(CrackLcg, TooFewSamplesFailsUpFront) {
    CrackFailure why = CrackFailure::none;
    EXPECT_FALSE(crack_lcg(reference_sequence(3), &why).has_value());
    EXPECT_EQ(why, CrackFailure::insufficient_samples);
    EXPECT_FALSE(crack_lcg({}, &why).has_value());
    EXPECT_EQ(why, CrackFailure::insufficient_samples);
}

TEST(CrackLcg, UnrelatedIntegersFail) {
    std::vector<cpp_int> noise = {11, 57, 3, 999, 123456, 42, 7, 100000};
    CrackFailure why = CrackFailure::none;
    EXPECT_FALSE(crack_lcg(noise, &why).has_value());
    EXPECT_NE(why, CrackFailure::none);
}

TEST(CrackLcg, ArithmeticProgressionHasDegenerateModulus) {
    CrackFailure why = CrackFailure::none;
    EXPECT_FALSE(crack_lcg({5, 10, 15, 20, 25}, &why).has_value());
    EXPECT_EQ(why, CrackFailure::degenerate_modulus);
}

TEST(CrackLcg, NegativeSampleRejected) {
    CrackFailure why = CrackFailure::none;
    EXPECT_FALSE(crack_lcg({-1, 5, 2, 7, 3}, &why).has_value());
    EXPECT_EQ(why, CrackFailure::negative_sample);
}

TEST(CrackLcg, FourSamplesCanLeaveNonInvertibleCandidate) {
    CrackFailure why = CrackFailure::none;
    EXPECT_FALSE(crack_lcg(reference_sequence(4), &why).has_value());
    EXPECT_EQ(why, CrackFailure::non_invertible);
}

TEST(CrackLcg, ValueAboveModulusIsInconsistent) {
    std::vector<cpp_int> values = reference_sequence(10);
    values.back() += kModulus;
    CrackFailure why = CrackFailure::none;
    EXPECT_FALSE(crack_lcg(values, &why).has_value());
    EXPECT_EQ(why, CrackFailure::inconsistent_sequence);
}

TEST(CrackLcgKnownModulus, ThreeSamplesSuffice) {
    std::vector<cpp_int> values = observed(LCG(32760, 5039, 76581, kModulus), 3);
    std::optional<LCG> cracked = crack_lcg_known_modulus(values, kModulus);
    ASSERT_TRUE(cracked.has_value());
    EXPECT_EQ(*cracked, LCG(values.back(), 5039, 76581, kModulus));
}

TEST(CrackLcgKnownModulus, WorksWhereBlindCrackFails) {
    std::vector<cpp_int> values = reference_sequence(4);
    EXPECT_FALSE(crack_lcg(values).has_value());
    std::optional<LCG> cracked = crack_lcg_known_modulus(values, kModulus);
    ASSERT_TRUE(cracked.has_value());
    EXPECT_EQ(cracked->a, 5039);
    EXPECT_EQ(cracked->c, 0);
}

TEST(CrackLcgKnownModulus, TamperedValueIsInconsistent) {
    std::vector<cpp_int> values = reference_sequence(5);
    values[4] += 1;
    CrackFailure why = CrackFailure::none;
    EXPECT_FALSE(crack_lcg_known_modulus(values, kModulus, &why).has_value());
    EXPECT_EQ(why, CrackFailure::inconsistent_sequence);
}

TEST(CrackLcgKnownModulus, RejectsDegenerateModulusAndShortInput) {
    CrackFailure why = CrackFailure::none;
    EXPECT_FALSE(crack_lcg_known_modulus({1, 2, 3}, 1, &why).has_value());
    EXPECT_EQ(why, CrackFailure::degenerate_modulus);
    EXPECT_FALSE(crack_lcg_known_modulus({1, 2}, kModulus, &why).has_value());
    EXPECT_EQ(why, CrackFailure::insufficient_samples);
}

TEST(CrackFailureStr, EveryReasonHasMessage) {
    EXPECT_STREQ(crack_failure_str(CrackFailure::none), "ok");
    EXPECT_STREQ(crack_failure_str(CrackFailure::insufficient_samples), "insufficient samples");
    EXPECT_STREQ(crack_failure_str(CrackFailure::degenerate_modulus), "degenerate modulus");
    EXPECT_STREQ(crack_failure_str(CrackFailure::negative_sample), "negative sample");
    EXPECT_STREQ(crack_failure_str(CrackFailure::non_invertible),
                 "first difference not invertible modulo candidate");
    EXPECT_STREQ(crack_failure_str(CrackFailure::inconsistent_sequence),
                 "sequence inconsistent with a single LCG");
}
