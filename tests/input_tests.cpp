#include <gtest/gtest.h>
#include "core/FilterReport.hpp"
#include "core/InputSource.hpp"
#include <sstream>

namespace {

    Alignment parseVcf(const std::string& text, FilterReport& report){
        std::istringstream in(text);
        return VcfSource::parse(in, report);
    }

    const std::string vcfHeader =
        "##fileformat=VCFv4.2\n"
        "##source=test\n"
        "#CHROM\tPOS\tID\tREF\tALT\tQUAL\tFILTER\tINFO\tFORMAT\tspA\tspB\tspC\n";
}

// The first line is a header and blank lines are skipped
TEST(PhylipTest, ParsesSpecimensAndUppercases) {
    std::istringstream in("3 4\nspA acgt\n\nspB ACGA\n  spC   ACGC  \n");
    Alignment aln = PhylipSource::parse(in);

    ASSERT_EQ(aln.getNumTaxa(), 3);
    EXPECT_EQ(aln.getNumChar(), 4);
    EXPECT_EQ(aln.getTaxaNames()[0], "spA");
    EXPECT_EQ(aln.getSequence(0), "ACGT");
    EXPECT_EQ(aln.getSequence(2), "ACGC");
    EXPECT_EQ(aln.getFormat(), SequenceFormat::UNKNOWN);
}

TEST(PhylipDeathTest, UnequalLengths) {
    std::istringstream in("2 4\nspA ACGT\nspB ACG\n");
    EXPECT_EXIT(PhylipSource::parse(in), ::testing::ExitedWithCode(1), "different lengths");
}

TEST(PhylipDeathTest, MissingSequence) {
    std::istringstream in("2 4\nspA ACGT\nspB\n");
    EXPECT_EXIT(PhylipSource::parse(in), ::testing::ExitedWithCode(1), "specimen id and a sequence");
}

TEST(PhylipDeathTest, UnreadableFile) {
    FilterReport report{};
    PhylipSource source{"/nonexistent/input.phy"};
    EXPECT_EXIT(source.normalize(report), ::testing::ExitedWithCode(1), "Unable to open input file");
}

// Genotypes turn into plain bases or ambiguity codes regardless of allele order
TEST(VcfTest, GenotypesToSymbols) {
    FilterReport report{};
    Alignment aln = parseVcf(vcfHeader +
        "1\t10\t.\tA\tG\t.\tPASS\t.\tGT\t0/0\t0/1\t1/1\n"
        "1\t20\t.\tc\tt\t.\tPASS\t.\tGT:DP\t1|0:4\t1|1:7\t0|0:2\n"
        "1\t30\t.\tG\tT\t.\tPASS\t.\tDP:GT\t3:./.\t3:0/.\t3:1/0\n", report);

    ASSERT_EQ(aln.getNumTaxa(), 3);
    ASSERT_EQ(aln.getNumChar(), 3);
    EXPECT_EQ(aln.getFormat(), SequenceFormat::NUCLEOTIDE);
    EXPECT_EQ(aln.getTaxaNames()[1], "spB");
    EXPECT_EQ(aln.getSequence(0), "AYN");
    EXPECT_EQ(aln.getSequence(1), "RTN");
    EXPECT_EQ(aln.getSequence(2), "GCK");
    EXPECT_EQ(report.halfCalledSites, 1);
}

// Records that are not single-base SNPs are only tallied
TEST(VcfTest, ComplexRecordsAreTallied) {
    FilterReport report{};
    Alignment aln = parseVcf(vcfHeader +
        "1\t10\t.\tAT\tA\t.\tPASS\t.\tGT\t0/0\t0/1\t1/1\n"
        "1\t20\t.\tA\tAT\t.\tPASS\t.\tGT\t0/0\t0/1\t1/1\n"
        "1\t30\t.\tA\tC,G\t.\tPASS\t.\tGT\t0/0\t0/1\t1/2\n"
        "1\t40\t.\tA\tC,G,T\t.\tPASS\t.\tGT\t0/0\t0/3\t1/2\n"
        "1\t50\t.\tA\tC\t.\tPASS\t.\tGT\t0/0\t0/1\t1/1\n", report);

    EXPECT_EQ(aln.getNumChar(), 1);
    EXPECT_EQ(report.getExcluded(INDEL), 2);
    EXPECT_EQ(report.getExcluded(TRIALLELIC), 1);
    EXPECT_EQ(report.getExcluded(TETRAALLELIC), 1);
    EXPECT_EQ(aln.getSequence(1), "M");
}

TEST(VcfDeathTest, MissingHeader) {
    FilterReport report{};
    EXPECT_EXIT(parseVcf("##fileformat=VCFv4.2\n1\t10\t.\tA\tG\t.\tPASS\t.\tGT\t0/0\n", report),
                ::testing::ExitedWithCode(1), "#CHROM");
    EXPECT_EXIT(parseVcf("##fileformat=VCFv4.2\n", report), ::testing::ExitedWithCode(1), "#CHROM");
}

TEST(VcfDeathTest, MissingGtField) {
    FilterReport report{};
    EXPECT_EXIT(parseVcf(vcfHeader + "1\t10\t.\tA\tG\t.\tPASS\t.\tDP\t1\t2\t3\n", report),
                ::testing::ExitedWithCode(1), "Expected 'GT' in FORMAT");
}

TEST(VcfDeathTest, BadSeparator) {
    FilterReport report{};
    EXPECT_EXIT(parseVcf(vcfHeader + "1\t10\t.\tA\tG\t.\tPASS\t.\tGT\t0/0\t01\t1/1\n", report),
                ::testing::ExitedWithCode(1), "separated by");
}

TEST(VcfDeathTest, BadAlleleIndex) {
    FilterReport report{};
    EXPECT_EXIT(parseVcf(vcfHeader + "1\t10\t.\tA\tG\t.\tPASS\t.\tGT\t0/0\t0/2\t1/1\n", report),
                ::testing::ExitedWithCode(1), "bi-allelic");
}

TEST(VcfDeathTest, UnknownBasePair) {
    FilterReport report{};
    EXPECT_EXIT(parseVcf(vcfHeader + "1\t10\t.\tA\t*\t.\tPASS\t.\tGT\t0/0\t0/1\t1/1\n", report),
                ::testing::ExitedWithCode(1), "Unexpected genotype");
}

TEST(VcfDeathTest, WrongColumnCount) {
    FilterReport report{};
    EXPECT_EXIT(parseVcf(vcfHeader + "1\t10\t.\tA\tG\t.\tPASS\t.\tGT\t0/0\t0/1\n", report),
                ::testing::ExitedWithCode(1), "columns in vcf record");
}

// Dispatch through the variant reaches the right reader
TEST(InputSourceDeathTest, DispatchReportsPath) {
    FilterReport report{};
    InputSource source{VcfSource{"/nonexistent/input.vcf"}};
    EXPECT_EQ(inputPath(source), "/nonexistent/input.vcf");
    EXPECT_EXIT(normalizeInput(source, report), ::testing::ExitedWithCode(1), "/nonexistent/input.vcf");
}
