/**
 * @file x12_tokenizer_test.cpp
 * @brief Unit tests for delimiter discovery and segment tokenization
 */

#include "edi/x12/protocol/x12/x12_tokenizer.h"

#include "utils/test_helpers.h"

#include <gtest/gtest.h>

#include <string>

namespace edi::x12::test {
namespace {

using namespace x12_samples;

// =============================================================================
// Delimiter Extraction
// =============================================================================

TEST(X12DelimiterTest, ExtractsStandardDelimiters) {
    auto delimiters = extract_delimiters(PURCHASE_ORDER_850);
    ASSERT_EXPECTED_OK(delimiters);

    EXPECT_EQ(delimiters->element_separator, '*');
    EXPECT_EQ(delimiters->subelement_separator, '>');
    EXPECT_EQ(delimiters->segment_terminator, '~');
}

TEST(X12DelimiterTest, ExtractsNewlineTerminator) {
    auto delimiters = extract_delimiters(INVOICE_810_NEWLINES);
    ASSERT_EXPECTED_OK(delimiters);

    EXPECT_EQ(delimiters->element_separator, '*');
    EXPECT_EQ(delimiters->subelement_separator, '>');
    EXPECT_EQ(delimiters->segment_terminator, '\n');
}

TEST(X12DelimiterTest, ExtractsCustomDelimiters) {
    auto document = replace_all(ISA_HEADER, '*', '|');
    document = replace_all(document, '>', ':');
    document = replace_all(document, '~', '\'');

    auto delimiters = extract_delimiters(document);
    ASSERT_EXPECTED_OK(delimiters);

    EXPECT_EQ(delimiters->element_separator, '|');
    EXPECT_EQ(delimiters->subelement_separator, ':');
    EXPECT_EQ(delimiters->segment_terminator, '\'');
}

TEST(X12DelimiterTest, EmptyInputIsTruncated) {
    auto delimiters = extract_delimiters("");
    ASSERT_EXPECTED_ERROR(delimiters);
    EXPECT_EQ(delimiters.error().code, x12_error::truncated_input);
}

TEST(X12DelimiterTest, HeaderOneByteShortIsTruncated) {
    auto header = ISA_HEADER.substr(0, X12_MIN_HEADER_LENGTH - 1);

    auto delimiters = extract_delimiters(header);
    ASSERT_EXPECTED_ERROR(delimiters);
    EXPECT_EQ(delimiters.error().code, x12_error::truncated_input);
}

TEST(X12DelimiterTest, ExactMinimumHeaderIsAccepted) {
    ASSERT_EQ(ISA_HEADER.size(), X12_MIN_HEADER_LENGTH);
    EXPECT_EXPECTED_OK(extract_delimiters(ISA_HEADER));
}

TEST(X12DelimiterTest, RepeatedDelimiterIsCollision) {
    // ISA16 set to the element separator
    auto header = std::string(ISA_HEADER);
    header[X12_ISA_DELIMITER_OFFSET + 1] = '*';

    auto delimiters = extract_delimiters(header);
    ASSERT_EXPECTED_ERROR(delimiters);
    EXPECT_EQ(delimiters.error().code, x12_error::delimiter_collision);
}

TEST(X12DelimiterTest, TerminatorMatchingSubelementIsCollision) {
    auto header = std::string(ISA_HEADER);
    header[X12_ISA_DELIMITER_OFFSET + 2] = '>';

    auto delimiters = extract_delimiters(header);
    ASSERT_EXPECTED_ERROR(delimiters);
    EXPECT_EQ(delimiters.error().code, x12_error::delimiter_collision);
}

TEST(X12DelimiterTest, LeadingWhitespaceIsSkipped) {
    std::string document = "\r\n  ";
    document += PURCHASE_ORDER_850;

    EXPECT_EQ(find_header_start(document), 4u);

    auto segments = tokenize(document);
    ASSERT_EXPECTED_OK(segments);
    EXPECT_EQ((*segments)[0][0], "ISA");
}

// =============================================================================
// Element Splitting
// =============================================================================

TEST(X12SplitElementsTest, KeepsEmptyElements) {
    auto tokens = split_elements("BEG*00**PO-1*", '*');

    ASSERT_EQ(tokens.size(), 5u);
    EXPECT_EQ(tokens[0], "BEG");
    EXPECT_EQ(tokens[1], "00");
    EXPECT_EQ(tokens[2], "");
    EXPECT_EQ(tokens[3], "PO-1");
    EXPECT_EQ(tokens[4], "");
}

TEST(X12SplitElementsTest, TagOnlySegment) {
    auto tokens = split_elements("LS", '*');

    ASSERT_EQ(tokens.size(), 1u);
    EXPECT_EQ(tokens[0], "LS");
}

TEST(X12SplitElementsTest, SubelementSeparatorIsNotSplit) {
    auto tokens = split_elements("SV1*HC>99213*100", '*');

    ASSERT_EQ(tokens.size(), 3u);
    EXPECT_EQ(tokens[1], "HC>99213");
}

TEST(X12TrimTest, StripsSurroundingWhitespace) {
    EXPECT_EQ(trim("  ST \r\n"), "ST");
    EXPECT_EQ(trim("\t\t"), "");
    EXPECT_EQ(trim("A B"), "A B");
}

// =============================================================================
// Tokenization
// =============================================================================

TEST(X12TokenizerTest, SplitsSegmentsInOrder) {
    auto segments = tokenize(PURCHASE_ORDER_850);
    ASSERT_EXPECTED_OK(segments);

    ASSERT_EQ(segments->size(), 9u);
    EXPECT_EQ((*segments)[0][0], "ISA");
    EXPECT_EQ((*segments)[1][0], "GS");
    EXPECT_EQ((*segments)[2][0], "ST");
    EXPECT_EQ((*segments)[3][0], "BEG");
    EXPECT_EQ((*segments)[6][0], "SE");
    EXPECT_EQ((*segments)[8][0], "IEA");
}

TEST(X12TokenizerTest, IsaKeepsSeventeenTokens) {
    auto segments = tokenize(PURCHASE_ORDER_850);
    ASSERT_EXPECTED_OK(segments);

    const auto& isa = (*segments)[0];
    ASSERT_EQ(isa.size(), 17u);
    EXPECT_EQ(isa[2], "          ");
    EXPECT_EQ(isa[6], "SENDERISA      ");
    EXPECT_EQ(isa[16], ">");
}

TEST(X12TokenizerTest, DropsEmptySegmentsBetweenTerminators) {
    std::string document(PURCHASE_ORDER_850);
    document = replace_first(document, "CTT*1~", "CTT*1~~  ~\n~");

    auto segments = tokenize(document);
    ASSERT_EXPECTED_OK(segments);
    EXPECT_EQ(segments->size(), 9u);
}

TEST(X12TokenizerTest, TrailingTerminatorIsOptional) {
    auto without = PURCHASE_ORDER_850.substr(0, PURCHASE_ORDER_850.size() - 1);

    auto with_terminator = tokenize(PURCHASE_ORDER_850);
    auto without_terminator = tokenize(without);
    ASSERT_EXPECTED_OK(with_terminator);
    ASSERT_EXPECTED_OK(without_terminator);

    EXPECT_EQ(*with_terminator, *without_terminator);
}

TEST(X12TokenizerTest, TrimsLineBreaksAfterTerminators) {
    auto document = replace_all(PURCHASE_ORDER_850, '~', '\x01');
    std::string pretty;
    for (char c : document) {
        if (c == '\x01') {
            pretty += "~\r\n";
        } else {
            pretty += c;
        }
    }

    auto segments = tokenize(pretty);
    ASSERT_EXPECTED_OK(segments);
    ASSERT_EQ(segments->size(), 9u);
    EXPECT_EQ((*segments)[1][0], "GS");
    EXPECT_EQ((*segments)[8].back(), "000000001");
}

TEST(X12TokenizerTest, NewlineTerminatedDocument) {
    auto segments = tokenize(INVOICE_810_NEWLINES);
    ASSERT_EXPECTED_OK(segments);

    ASSERT_EQ(segments->size(), 22u);
    EXPECT_EQ((*segments)[1][0], "GS");
    EXPECT_EQ((*segments)[1][8], "004010VICS");
    EXPECT_EQ((*segments)[21][0], "IEA");
}

TEST(X12TokenizerTest, ExplicitDelimitersMustBeDistinct) {
    x12_delimiters delimiters{.element_separator = '*',
                              .subelement_separator = '*',
                              .segment_terminator = '~'};

    auto segments = tokenize("ST*850*0001~", delimiters);
    ASSERT_EXPECTED_ERROR(segments);
    EXPECT_EQ(segments.error().code, x12_error::delimiter_collision);
}

TEST(X12TokenizerTest, ExplicitDelimitersSkipHeaderDiscovery) {
    x12_delimiters delimiters{.element_separator = '|',
                              .subelement_separator = ':',
                              .segment_terminator = '\n'};

    auto segments = tokenize("ST|850|0001\nBEG|00\n", delimiters);
    ASSERT_EXPECTED_OK(segments);

    ASSERT_EQ(segments->size(), 2u);
    EXPECT_EQ((*segments)[0][1], "850");
    EXPECT_EQ((*segments)[1][0], "BEG");
}

}  // namespace
}  // namespace edi::x12::test
