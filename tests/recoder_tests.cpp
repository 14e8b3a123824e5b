#include <gtest/gtest.h>
#include "analysis/FormatClassifier.hpp"
#include "analysis/SiteRecoder.hpp"
#include "core/InputSource.hpp"
#include "core/Nucleotides.hpp"
#include <set>
#include <sstream>

namespace {

    std::string column(const Alignment& aln, int s){
        std::string c;
        for(int t = 0; t < aln.getNumTaxa(); t++){
            c.push_back(aln(t, s));
        }
        return c;
    }
}

class SiteRecoderTest : public ::testing::Test {
protected:
    void SetUp() override {

    }

    // Records every polarity decision so the tests can decode the output
    SiteRecoder recordingRecoder(SiteMode mode = SiteMode::ALL){
        return SiteRecoder([this](){
            bool swap = (swaps.size() % 3 == 1);
            swaps.push_back(swap);
            return swap;
        }, mode);
    }

    boost::random::mt19937 rng{42};
    std::vector<bool> swaps;
    FilterReport report{};
};

TEST(FormatClassifierTest, Nucleotide) {
    Alignment aln({"a", "b"}, {"ACGTN-", "RYSWKM"});
    EXPECT_EQ(FormatClassifier::classify(aln), SequenceFormat::NUCLEOTIDE);
}

TEST(FormatClassifierTest, Binary) {
    Alignment aln({"a", "b"}, {"012?", "2-N0"});
    EXPECT_EQ(FormatClassifier::classify(aln), SequenceFormat::BINARY);
}

// Alignments from a vcf are trusted without a scan
TEST(FormatClassifierTest, KnownFormat) {
    Alignment aln({"a"}, {"A"}, SequenceFormat::NUCLEOTIDE);
    EXPECT_EQ(FormatClassifier::classify(aln), SequenceFormat::NUCLEOTIDE);
}

TEST(FormatClassifierDeathTest, MixedAlphabet) {
    Alignment aln({"a", "b"}, {"AC", "01"});
    EXPECT_EXIT(FormatClassifier::classify(aln), ::testing::ExitedWithCode(1), "could not be recognized");
}

// Three specimens ACGT/ACGA/ACGC: three monomorphic columns and one tri-allelic column
TEST_F(SiteRecoderTest, PhylipExample) {
    std::istringstream in("3 4\ns1 ACGT\ns2 ACGA\ns3 ACGC\n");
    Alignment aln = PhylipSource::parse(in);
    SiteRecoder recoder{rng};

    Alignment matrix = recoder(aln, FormatClassifier::classify(aln), report);
    EXPECT_EQ(matrix.getNumChar(), 0);
    EXPECT_EQ(matrix.getNumTaxa(), 3);
    EXPECT_EQ(report.getExcluded(MONOMORPHIC), 3);
    EXPECT_EQ(report.getExcluded(TRIALLELIC), 1);
    EXPECT_EQ(report.recoderSites, 4);
}

TEST_F(SiteRecoderTest, AlleleCardinality) {
    Alignment aln({"a", "b", "c"}, {"N-AAR", "?NCCY", "-NGKA"});
    SiteRecoder recoder{rng};

    Alignment matrix = recoder(aln, SequenceFormat::NUCLEOTIDE, report);
    EXPECT_EQ(matrix.getNumChar(), 0);
    EXPECT_EQ(report.getExcluded(MISSING), 2);
    EXPECT_EQ(report.getExcluded(TRIALLELIC), 1);
    EXPECT_EQ(report.getExcluded(TETRAALLELIC), 2);
}

// Homozygous REF and ALT get opposite codes and the heterozygote always gets "1"
TEST_F(SiteRecoderTest, VcfGenotypeExample) {
    std::istringstream in(
        "#CHROM\tPOS\tID\tREF\tALT\tQUAL\tFILTER\tINFO\tFORMAT\thomRef\thet\thomAlt\n"
        "1\t10\t.\tA\tG\t.\tPASS\t.\tGT\t0/0\t0/1\t1/1\n");
    Alignment aln = VcfSource::parse(in, report);

    for(bool swap : {false, true}){
        FilterReport r{};
        SiteRecoder recoder{[swap](){ return swap; }};
        Alignment matrix = recoder(aln, SequenceFormat::NUCLEOTIDE, r);

        ASSERT_EQ(matrix.getNumChar(), 1);
        EXPECT_EQ(matrix(1, 0), '1');
        EXPECT_NE(matrix(0, 0), matrix(2, 0));
        EXPECT_TRUE(matrix(0, 0) == '0' || matrix(0, 0) == '2');
        EXPECT_TRUE(matrix(2, 0) == '0' || matrix(2, 0) == '2');
    }
}

// Decoding 0/2 with the chosen bases and 1 with their ambiguity code gives back the input
TEST_F(SiteRecoderTest, DecodingRestoresGenotypes) {
    Alignment aln({"a", "b", "c", "d"}, {"AACGTAC", "GRMKWTY", "RGANAW?", "-GCGWTT"});
    SiteRecoder recoder = recordingRecoder();

    Alignment matrix = recoder(aln, SequenceFormat::NUCLEOTIDE, report);
    ASSERT_EQ(matrix.getNumChar(), aln.getNumChar());
    ASSERT_EQ(swaps.size(), static_cast<size_t>(aln.getNumChar()));

    for(int s = 0; s < aln.getNumChar(); s++){
        std::set<char> bases;
        for(int t = 0; t < aln.getNumTaxa(); t++){
            std::pair<char, char> pair;
            if(Nucleotides::expand(aln(t, s), pair)){
                bases.insert(pair.first);
                bases.insert(pair.second);
            }
        }
        ASSERT_EQ(bases.size(), 2u);

        char zeroBase = swaps[s] ? *bases.rbegin() : *bases.begin();
        char twoBase = swaps[s] ? *bases.begin() : *bases.rbegin();
        for(int t = 0; t < aln.getNumTaxa(); t++){
            char original = aln(t, s);
            switch(matrix(t, s)){
                case '0':
                    EXPECT_EQ(original, zeroBase);
                    break;
                case '2':
                    EXPECT_EQ(original, twoBase);
                    break;
                case '1':
                    EXPECT_EQ(original, Nucleotides::genotypeCode(zeroBase, twoBase));
                    break;
                case '-':
                    EXPECT_TRUE(Nucleotides::isMissing(original));
                    break;
                default:
                    ADD_FAILURE() << "Unexpected symbol " << matrix(t, s);
            }
        }
    }
}

TEST_F(SiteRecoderTest, TransversionsOnly) {
    Alignment aln({"a", "b"}, {"AACT", "GCCC"});
    SiteRecoder recoder{rng, SiteMode::TRANSVERSIONS_ONLY};

    Alignment matrix = recoder(aln, SequenceFormat::NUCLEOTIDE, report);
    EXPECT_EQ(matrix.getNumChar(), 1);
    EXPECT_EQ(report.getExcluded(EXCLUDED_TRANSITION), 2);
    EXPECT_EQ(report.getExcluded(MONOMORPHIC), 1);
    EXPECT_EQ(report.getExcluded(EXCLUDED_TRANSVERSION), 0);
}

TEST_F(SiteRecoderTest, TransitionsOnly) {
    Alignment aln({"a", "b"}, {"AACT", "GCCC"});
    SiteRecoder recoder{rng, SiteMode::TRANSITIONS_ONLY};

    Alignment matrix = recoder(aln, SequenceFormat::NUCLEOTIDE, report);
    EXPECT_EQ(matrix.getNumChar(), 2);
    EXPECT_EQ(report.getExcluded(EXCLUDED_TRANSVERSION), 1);
    EXPECT_EQ(report.getExcluded(EXCLUDED_TRANSITION), 0);
}

// With a real random source both polarities show up over many sites
TEST_F(SiteRecoderTest, PolarityIsRandomized) {
    std::string a(200, 'A');
    std::string b(200, 'G');
    Alignment aln({"a", "b"}, {a, b});
    SiteRecoder recoder{rng};

    Alignment matrix = recoder(aln, SequenceFormat::NUCLEOTIDE, report);
    ASSERT_EQ(matrix.getNumChar(), 200);

    int zeroForA = 0;
    for(int s = 0; s < 200; s++){
        EXPECT_NE(matrix(0, s), matrix(1, s));
        if(matrix(0, s) == '0')
            zeroForA++;
    }
    EXPECT_GT(zeroForA, 0);
    EXPECT_LT(zeroForA, 200);
}

// Binary columns with two or more states are copied through unchanged
TEST_F(SiteRecoderTest, BinaryPassThrough) {
    Alignment aln({"a", "b", "c"}, {"0?0102", "0-2?2-", "0N2210"});
    SiteRecoder recoder{rng};

    Alignment matrix = recoder(aln, SequenceFormat::BINARY, report);
    ASSERT_EQ(matrix.getNumChar(), 4);
    EXPECT_EQ(report.getExcluded(MONOMORPHIC), 1);
    EXPECT_EQ(report.getExcluded(MISSING), 1);

    EXPECT_EQ(column(matrix, 0), column(aln, 2));
    EXPECT_EQ(column(matrix, 1), column(aln, 3));
    EXPECT_EQ(column(matrix, 2), column(aln, 4));
    EXPECT_EQ(column(matrix, 3), column(aln, 5));

    EXPECT_TRUE(report.balanceChecked);
    EXPECT_EQ(report.numZeroStates, 3);
    EXPECT_EQ(report.numTwoStates, 5);
}

TEST_F(SiteRecoderTest, NucleotideSkipsBalanceCheck) {
    Alignment aln({"a", "b"}, {"A", "G"});
    SiteRecoder recoder{rng};
    recoder(aln, SequenceFormat::NUCLEOTIDE, report);
    EXPECT_FALSE(report.balanceChecked);
}

using SiteRecoderDeathTest = SiteRecoderTest;

TEST_F(SiteRecoderDeathTest, UnexpectedBase) {
    Alignment aln({"a", "b"}, {"A", "X"});
    SiteRecoder recoder{rng};
    EXPECT_EXIT(recoder(aln, SequenceFormat::NUCLEOTIDE, report), ::testing::ExitedWithCode(1), "unexpected base at position 1");
}
