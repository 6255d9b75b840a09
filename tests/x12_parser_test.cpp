/**
 * @file x12_parser_test.cpp
 * @brief Unit tests for X12 document assembly
 */

#include "edi/x12/protocol/x12/x12_parser.h"

#include "utils/test_helpers.h"

#include <gtest/gtest.h>

#include <atomic>
#include <thread>
#include <vector>

namespace edi::x12::test {
namespace {

using namespace x12_samples;

class X12ParserTest : public x12_edi_test {
protected:
    x12_parser parser_;
};

// =============================================================================
// Successful Parsing
// =============================================================================

TEST_F(X12ParserTest, ParsesInterchangeHeader) {
    auto result = parser_.parse(PURCHASE_ORDER_850);
    ASSERT_EXPECTED_OK(result);

    ASSERT_EQ(result->interchanges.size(), 1u);
    const auto& isa = result->interchanges[0];

    EXPECT_EQ(isa.authorization_qualifier, "00");
    EXPECT_EQ(isa.authorization_information, "");
    EXPECT_EQ(isa.security_qualifier, "00");
    EXPECT_EQ(isa.security_information, "");
    EXPECT_EQ(isa.sender_qualifier, "ZZ");
    EXPECT_EQ(isa.sender_id, "SENDERISA");
    EXPECT_EQ(isa.receiver_qualifier, "14");
    EXPECT_EQ(isa.receiver_id, "0073268795005");
    EXPECT_EQ(isa.date, "020226");
    EXPECT_EQ(isa.time, "1534");
    EXPECT_EQ(isa.standards_id, "U");
    EXPECT_EQ(isa.version, "00401");
    EXPECT_EQ(isa.interchange_control_number, "000000001");
    EXPECT_EQ(isa.acknowledgment_requested, "0");
    EXPECT_EQ(isa.test_indicator, "T");
}

TEST_F(X12ParserTest, ParsesFunctionalGroupHeader) {
    auto result = parser_.parse(PURCHASE_ORDER_850);
    ASSERT_EXPECTED_OK(result);

    ASSERT_EQ(result->interchanges[0].functional_groups.size(), 1u);
    const auto& group = result->interchanges[0].functional_groups[0];

    EXPECT_EQ(group.functional_identifier_code, "PO");
    EXPECT_EQ(group.application_sender_code, "SENDERGS");
    EXPECT_EQ(group.application_receiver_code, "007326879");
    EXPECT_EQ(group.date, "20020226");
    EXPECT_EQ(group.time, "1534");
    EXPECT_EQ(group.group_control_number, "1");
    EXPECT_EQ(group.responsible_agency_code, "X");
    EXPECT_EQ(group.version, "004010");
}

TEST_F(X12ParserTest, ParsesTransactionAndBodySegments) {
    auto result = parser_.parse(PURCHASE_ORDER_850);
    ASSERT_EXPECTED_OK(result);

    const auto& group = result->interchanges[0].functional_groups[0];
    ASSERT_EQ(group.transactions.size(), 1u);
    const auto& txn = group.transactions[0];

    EXPECT_EQ(txn.transaction_code, "850");
    EXPECT_EQ(txn.transaction_name, "Purchase Order");
    EXPECT_EQ(txn.transaction_set_control_number, "000000001");
    EXPECT_FALSE(txn.implementation_convention_reference.has_value());

    ASSERT_EQ(txn.segments.size(), 3u);
    EXPECT_EQ(txn.segments[0].tag, "BEG");
    EXPECT_EQ(txn.segments[0].elements,
              (std::vector<std::string>{"00", "SA", "PO-1001", "", "20020226"}));
    EXPECT_EQ(txn.segments[0].element(3), "PO-1001");
    EXPECT_EQ(txn.segments[0].element(4), "");
    EXPECT_EQ(txn.segments[1].tag, "PO1");
    EXPECT_EQ(txn.segments[2].tag, "CTT");
    EXPECT_EQ(txn.declared_segment_count(), 5u);
}

TEST_F(X12ParserTest, RecordsDelimiters) {
    auto result = parser_.parse(PURCHASE_ORDER_850);
    ASSERT_EXPECTED_OK(result);

    EXPECT_EQ(result->delimiters.element_separator, '*');
    EXPECT_EQ(result->delimiters.subelement_separator, '>');
    EXPECT_EQ(result->delimiters.segment_terminator, '~');
}

TEST_F(X12ParserTest, ImplementationConventionReferenceMayBeEmpty) {
    auto result = parser_.parse(PRODUCT_REGISTRATION_140);
    ASSERT_EXPECTED_OK(result);

    const auto& txn =
        result->interchanges[0].functional_groups[0].transactions[0];
    EXPECT_EQ(txn.transaction_code, "140");
    EXPECT_EQ(txn.transaction_name, "Product Registration");
    ASSERT_TRUE(txn.implementation_convention_reference.has_value());
    EXPECT_EQ(*txn.implementation_convention_reference, "");
    ASSERT_EQ(txn.segments.size(), 2u);
    EXPECT_EQ(txn.segments[1].elements,
              (std::vector<std::string>{"15", "OTHER_TEST_ID", "", "", "END"}));
}

TEST_F(X12ParserTest, ImplementationConventionReferenceValue) {
    auto document = replace_first(PURCHASE_ORDER_850, "ST*850*000000001~",
                                  "ST*850*000000001*005010X220A1~");

    auto result = parser_.parse(document);
    ASSERT_EXPECTED_OK(result);

    const auto& txn =
        result->interchanges[0].functional_groups[0].transactions[0];
    ASSERT_TRUE(txn.implementation_convention_reference.has_value());
    EXPECT_EQ(*txn.implementation_convention_reference, "005010X220A1");
}

TEST_F(X12ParserTest, ParsesMultipleInterchanges) {
    parse_details details;
    auto result = parser_.parse(MULTI_INTERCHANGE, &details);
    ASSERT_EXPECTED_OK(result);

    ASSERT_EQ(result->interchanges.size(), 2u);
    EXPECT_EQ(result->interchanges[0].functional_groups.size(), 1u);
    EXPECT_EQ(result->interchanges[1].interchange_control_number, "000000002");
    EXPECT_EQ(result->interchanges[1].test_indicator, "P");

    const auto& groups = result->interchanges[1].functional_groups;
    ASSERT_EQ(groups.size(), 2u);
    ASSERT_EQ(groups[0].transactions.size(), 2u);
    EXPECT_EQ(groups[0].transactions[0].transaction_name, "Invoice");
    EXPECT_EQ(groups[0].transactions[1].transaction_set_control_number, "0002");
    ASSERT_EQ(groups[1].transactions.size(), 1u);
    EXPECT_EQ(groups[1].transactions[0].transaction_name,
              "Functional Acknowledgment");

    EXPECT_EQ(result->transaction_count(), 4u);
    EXPECT_EQ(details.interchange_count, 2u);
    EXPECT_EQ(details.functional_group_count, 3u);
    EXPECT_EQ(details.transaction_count, 4u);
}

TEST_F(X12ParserTest, ParsesNewlineTerminatedDocument) {
    auto result = parser_.parse(INVOICE_810_NEWLINES);
    ASSERT_EXPECTED_OK(result);

    EXPECT_EQ(result->delimiters.segment_terminator, '\n');
    const auto& txn =
        result->interchanges[0].functional_groups[0].transactions[0];
    EXPECT_EQ(txn.transaction_name, "Invoice");
    EXPECT_EQ(txn.segments.size(), 16u);
    EXPECT_EQ(result->interchanges[0].sender_id, "ABCDEFGHIJKLMNO");
}

TEST_F(X12ParserTest, ParsesCustomDelimiters) {
    auto document = replace_all(PURCHASE_ORDER_850, '*', '|');
    document = replace_all(document, '>', ':');

    auto result = parser_.parse(document);
    ASSERT_EXPECTED_OK(result);

    EXPECT_EQ(result->delimiters.element_separator, '|');
    EXPECT_EQ(result->delimiters.subelement_separator, ':');
    EXPECT_EQ(result->interchanges[0].sender_id, "SENDERISA");
    EXPECT_EQ(result->interchanges[0]
                  .functional_groups[0]
                  .transactions[0]
                  .segments[1]
                  .element(2),
              "10");
}

TEST_F(X12ParserTest, SkipsLeadingWhitespace) {
    std::string document = "\n\n   ";
    document += PURCHASE_ORDER_850;

    auto result = parser_.parse(document);
    ASSERT_EXPECTED_OK(result);
    EXPECT_EQ(result->interchanges.size(), 1u);
}

TEST_F(X12ParserTest, TrimsElementWhitespace) {
    auto document =
        replace_first(PURCHASE_ORDER_850, "CTT*1~", "CTT* 1 \t*  A B  ~");

    auto result = parser_.parse(document);
    ASSERT_EXPECTED_OK(result);

    const auto& segment = result->interchanges[0]
                              .functional_groups[0]
                              .transactions[0]
                              .segments[2];
    EXPECT_EQ(segment.elements, (std::vector<std::string>{"1", "A B"}));
}

TEST_F(X12ParserTest, AcceptsTagOnlySegment) {
    auto document = replace_first(PURCHASE_ORDER_850, "CTT*1~", "LS~");

    auto result = parser_.parse(document);
    ASSERT_EXPECTED_OK(result);

    const auto& segment = result->interchanges[0]
                              .functional_groups[0]
                              .transactions[0]
                              .segments[2];
    EXPECT_EQ(segment.tag, "LS");
    EXPECT_TRUE(segment.elements.empty());
    EXPECT_EQ(segment.element(1), "");
}

TEST_F(X12ParserTest, EmptyEnvelopesAreValid) {
    std::string document(ISA_HEADER);
    document += "GS*PO*SENDERGS*007326879*20020226*1534*7*X*004010~";
    document += "GE*0*7~";
    document += "IEA*1*000000001~";

    auto result = parser_.parse(document);
    ASSERT_EXPECTED_OK(result);
    ASSERT_EQ(result->interchanges[0].functional_groups.size(), 1u);
    EXPECT_TRUE(result->interchanges[0].functional_groups[0].transactions.empty());
}

// =============================================================================
// Transaction Catalog
// =============================================================================

TEST_F(X12ParserTest, UnknownTransactionCodeIsUnidentified) {
    auto document =
        replace_first(PURCHASE_ORDER_850, "ST*850*", "ST*ZZZ*");

    auto result = parser_.parse(document);
    ASSERT_EXPECTED_OK(result);

    const auto& txn =
        result->interchanges[0].functional_groups[0].transactions[0];
    EXPECT_EQ(txn.transaction_code, "ZZZ");
    EXPECT_EQ(txn.transaction_name, "unidentified");
}

TEST_F(X12ParserTest, CustomCatalogResolvesNames) {
    auto catalog = std::make_shared<const config::transaction_catalog>(
        std::map<std::string, std::string, std::less<>>{
            {"850", "Order From Partner"}});
    x12_parser parser(catalog);

    auto result = parser.parse(PURCHASE_ORDER_850);
    ASSERT_EXPECTED_OK(result);
    EXPECT_EQ(result->interchanges[0]
                  .functional_groups[0]
                  .transactions[0]
                  .transaction_name,
              "Order From Partner");
    EXPECT_EQ(parser.catalog(), catalog);
}

TEST_F(X12ParserTest, NullCatalogLeavesNamesUnidentified) {
    x12_parser parser(std::shared_ptr<const config::transaction_catalog>{});

    auto result = parser.parse(PURCHASE_ORDER_850);
    ASSERT_EXPECTED_OK(result);
    EXPECT_EQ(result->interchanges[0]
                  .functional_groups[0]
                  .transactions[0]
                  .transaction_name,
              "unidentified");
}

TEST_F(X12ParserTest, DefaultParserUsesSharedStandardCatalog) {
    EXPECT_EQ(parser_.catalog(), standard_catalog());
    EXPECT_TRUE(parser_.options().strict_envelope_validation);
}

// =============================================================================
// Structural Errors
// =============================================================================

TEST_F(X12ParserTest, EmptyDocumentIsTruncated) {
    EXPECT_THAT(parser_.parse(""), FailsWith(x12_error::truncated_input));
}

TEST_F(X12ParserTest, ShortDocumentIsTruncated) {
    EXPECT_THAT(parser_.parse("ISA*00*          *00~"),
                FailsWith(x12_error::truncated_input));
}

TEST_F(X12ParserTest, DelimiterCollisionIsReported) {
    auto document = std::string(PURCHASE_ORDER_850);
    document[X12_ISA_DELIMITER_OFFSET + 1] = '~';

    EXPECT_THAT(parser_.parse(document),
                FailsWith(x12_error::delimiter_collision));
}

TEST_F(X12ParserTest, IsaWithTooFewElementsIsMalformed) {
    auto document = std::string(PURCHASE_ORDER_850);
    // Merge ISA01/ISA02 and ISA03/ISA04 so the header keeps its length
    document[6] = ' ';
    document[20] = ' ';

    auto result = parser_.parse(document);
    ASSERT_EXPECTED_ERROR(result);
    EXPECT_EQ(result.error().code, x12_error::malformed_segment);
    EXPECT_EQ(result.error().segment_index, 0u);
    EXPECT_EQ(result.error().segment.size(), 15u);
}

TEST_F(X12ParserTest, GroupWithTooFewElementsIsMalformed) {
    auto document = replace_first(
        PURCHASE_ORDER_850, "GS*PO*SENDERGS*007326879*20020226*1534*1*X*004010~",
        "GS*PO*SENDERGS~");

    auto result = parser_.parse(document);
    ASSERT_EXPECTED_ERROR(result);
    EXPECT_EQ(result.error().code, x12_error::malformed_segment);
    EXPECT_EQ(result.error().segment_index, 1u);
    EXPECT_EQ(result.error().segment,
              (std::vector<std::string>{"GS", "PO", "SENDERGS"}));
}

TEST_F(X12ParserTest, TransactionWithTooFewElementsIsMalformed) {
    auto document =
        replace_first(PURCHASE_ORDER_850, "ST*850*000000001~", "ST*850~");

    auto result = parser_.parse(document);
    ASSERT_EXPECTED_ERROR(result);
    EXPECT_EQ(result.error().code, x12_error::malformed_segment);
    EXPECT_EQ(result.error().segment_index, 2u);
}

TEST_F(X12ParserTest, OrderingIsCheckedBeforeElementCount) {
    std::string document(ISA_HEADER);
    document += "ST*850~";

    auto result = parser_.parse(document);
    ASSERT_EXPECTED_ERROR(result);
    EXPECT_EQ(result.error().code, x12_error::out_of_order_segment);
}

TEST_F(X12ParserTest, BodySegmentOutsideTransactionIsOutOfOrder) {
    auto document =
        replace_first(PURCHASE_ORDER_850, "ST*850*000000001~", "");

    auto result = parser_.parse(document);
    ASSERT_EXPECTED_ERROR(result);
    EXPECT_EQ(result.error().code, x12_error::out_of_order_segment);
    EXPECT_EQ(result.error().segment_index, 2u);
    EXPECT_EQ(result.error().segment.front(), "BEG");
}

TEST_F(X12ParserTest, DocumentNotStartingWithIsaIsOutOfOrder) {
    auto result = parser_.parse(MISSING_INTERCHANGE);
    ASSERT_EXPECTED_ERROR(result);

    EXPECT_EQ(result.error().code, x12_error::out_of_order_segment);
    EXPECT_EQ(result.error().segment,
              (std::vector<std::string>{"GS", "PO", "SENDERGS", "007326879",
                                        "20020226", "1534", "1", "X",
                                        "004010"}));
    EXPECT_EQ(result.error().segment_index, 0u);
    EXPECT_THAT(result.error().reason,
                ContainsSubstring("GS segment appears before any ISA"));
}

TEST_F(X12ParserTest, LeadingSegmentEndsAtLineBreak) {
    auto document = replace_all(MISSING_INTERCHANGE, '~', '\n');

    auto result = loose_parse(document);
    ASSERT_EXPECTED_ERROR(result);
    EXPECT_EQ(result.error().code, x12_error::out_of_order_segment);
    ASSERT_EQ(result.error().segment.size(), 9u);
    EXPECT_EQ(result.error().segment.front(), "GS");
    EXPECT_EQ(result.error().segment.back(), "004010");
}

TEST_F(X12ParserTest, TrailerWithoutOpenerIsOutOfOrder) {
    std::string document(ISA_HEADER);
    document += "GE*0*1~IEA*0*000000001~";

    EXPECT_THAT(parser_.parse(document),
                FailsWith(x12_error::out_of_order_segment));
    EXPECT_THAT(loose_parse(document),
                FailsWith(x12_error::out_of_order_segment));
}

// =============================================================================
// Closing Scopes
// =============================================================================

TEST_F(X12ParserTest, InterchangeTrailerWithOpenTransactionFails) {
    auto document = replace_first(PURCHASE_ORDER_850,
                                  "SE*5*000000001~GE*1*1~", "");

    for (bool strict : {true, false}) {
        x12_parser parser(
            parser_options{.strict_envelope_validation = strict});

        auto result = parser.parse(document);
        ASSERT_EXPECTED_ERROR(result);
        EXPECT_EQ(result.error().code, x12_error::truncated_input);
        EXPECT_EQ(result.error().segment_index, 6u);
        EXPECT_EQ(result.error().segment,
                  (std::vector<std::string>{"IEA", "1", "000000001"}));
        EXPECT_THAT(result.error().reason,
                    ContainsSubstring("transaction 000000001 was not closed "
                                      "by an SE segment before IEA"));
    }
}

TEST_F(X12ParserTest, InterchangeTrailerWithOpenGroupFails) {
    auto document = replace_first(PURCHASE_ORDER_850, "GE*1*1~", "");

    auto result = parser_.parse(document);
    ASSERT_EXPECTED_ERROR(result);
    EXPECT_EQ(result.error().code, x12_error::truncated_input);
    EXPECT_EQ(result.error().segment_index, 7u);
    EXPECT_THAT(result.error().reason,
                ContainsSubstring("functional group 1 was not closed"));

    EXPECT_THAT(loose_parse(document), FailsWith(x12_error::truncated_input));
}

TEST_F(X12ParserTest, GroupTrailerWithOpenTransactionFails) {
    auto document = replace_first(PURCHASE_ORDER_850, "SE*5*000000001~", "");

    auto result = loose_parse(document);
    ASSERT_EXPECTED_ERROR(result);
    EXPECT_EQ(result.error().code, x12_error::truncated_input);
    EXPECT_EQ(result.error().segment_index, 6u);
    EXPECT_EQ(result.error().segment.front(), "GE");
}

TEST_F(X12ParserTest, SegmentAfterClosedTransactionIsOutOfOrder) {
    auto document = replace_first(PURCHASE_ORDER_850, "SE*5*000000001~",
                                  "SE*5*000000001~REF*DP*099~");

    auto result = parser_.parse(document);
    ASSERT_EXPECTED_ERROR(result);
    EXPECT_EQ(result.error().code, x12_error::out_of_order_segment);
    EXPECT_EQ(result.error().segment_index, 7u);
}

TEST_F(X12ParserTest, NewInterchangeInsideOpenGroupFails) {
    std::string document(ISA_HEADER);
    document += "GS*PO*SENDERGS*007326879*20020226*1534*1*X*004010~";
    document += ISA_HEADER;
    document += "ST*850*0001~";

    auto result = loose_parse(document);
    ASSERT_EXPECTED_ERROR(result);
    EXPECT_EQ(result.error().code, x12_error::truncated_input);
    EXPECT_EQ(result.error().segment_index, 2u);
    EXPECT_EQ(result.error().segment.front(), "ISA");
    EXPECT_THAT(result.error().reason,
                ContainsSubstring("functional group 1 was not closed"));
}

TEST_F(X12ParserTest, SiblingOpenersRequireClosedPredecessor) {
    auto second_group = replace_first(
        PURCHASE_ORDER_850, "GE*1*1~",
        "GS*PO*SENDERGS*007326879*20020226*1534*2*X*004010~GE*0*2~");
    auto second_transaction = replace_first(
        PURCHASE_ORDER_850, "SE*5*000000001~", "ST*850*000000002~");

    auto group_result = loose_parse(second_group);
    ASSERT_EXPECTED_ERROR(group_result);
    EXPECT_EQ(group_result.error().code, x12_error::truncated_input);
    EXPECT_EQ(group_result.error().segment_index, 7u);
    EXPECT_THAT(group_result.error().reason,
                ContainsSubstring("functional group 1 was not closed by a GE "
                                  "segment before GS"));

    auto txn_result = parser_.parse(second_transaction);
    ASSERT_EXPECTED_ERROR(txn_result);
    EXPECT_EQ(txn_result.error().code, x12_error::truncated_input);
    EXPECT_EQ(txn_result.error().segment_index, 6u);
    EXPECT_EQ(txn_result.error().segment,
              (std::vector<std::string>{"ST", "850", "000000002"}));
}

TEST_F(X12ParserTest, NewInterchangeInsideOpenInterchangeFails) {
    std::string document(ISA_HEADER);
    document += ISA_HEADER;
    document += "IEA*0*000000001~";

    auto result = parser_.parse(document);
    ASSERT_EXPECTED_ERROR(result);
    EXPECT_EQ(result.error().code, x12_error::truncated_input);
    EXPECT_EQ(result.error().segment_index, 1u);
    EXPECT_THAT(result.error().reason,
                ContainsSubstring("interchange 000000001 was not closed by "
                                  "an IEA segment before ISA"));
}

// =============================================================================
// Parse Details and Logging
// =============================================================================

TEST_F(X12ParserTest, FillsParseDetails) {
    parse_details details;
    auto result = parser_.parse(PURCHASE_ORDER_850, &details);
    ASSERT_EXPECTED_OK(result);

    EXPECT_EQ(details.segment_count, 9u);
    EXPECT_EQ(details.interchange_count, 1u);
    EXPECT_EQ(details.functional_group_count, 1u);
    EXPECT_EQ(details.transaction_count, 1u);
    EXPECT_EQ(details.unchecked_trailers, 0u);
    EXPECT_EQ(details.original_size, PURCHASE_ORDER_850.size());
    EXPECT_GE(details.parse_time_us, 0);
}

TEST_F(X12ParserTest, LogsDebugOnSuccess) {
    auto result = parser_.parse(PURCHASE_ORDER_850);
    ASSERT_EXPECTED_OK(result);

    EXPECT_GE(logger().count(integration::log_level::debug), 2u);
    EXPECT_EQ(logger().count(integration::log_level::warning), 0u);
}

TEST_F(X12ParserTest, LogsWarningOnFailure) {
    auto result = parser_.parse(MISSING_FUNCTIONAL_GROUP);
    ASSERT_EXPECTED_ERROR(result);

    ASSERT_EQ(logger().count(integration::log_level::warning), 1u);
    for (const auto& [level, message] : logger().entries()) {
        if (level == integration::log_level::warning) {
            EXPECT_THAT(message, ContainsSubstring("-1003"));
        }
    }
}

TEST_F(X12ParserTest, ErrorStringCarriesPositionAndTokens) {
    auto result = parser_.parse(MISSING_FUNCTIONAL_GROUP);
    ASSERT_EXPECTED_ERROR(result);

    auto text = result.error().to_string();
    EXPECT_THAT(text, ContainsSubstring("(segment 1)"));
    EXPECT_THAT(text, ContainsSubstring("[ST*997*0001]"));
}

// =============================================================================
// Assembly From Tokens
// =============================================================================

TEST_F(X12ParserTest, AssemblesTokenizedSegments) {
    auto segments = tokenize(PURCHASE_ORDER_850);
    ASSERT_EXPECTED_OK(segments);

    auto result = parser_.assemble(*segments);
    ASSERT_EXPECTED_OK(result);

    auto parsed = parser_.parse(PURCHASE_ORDER_850);
    ASSERT_EXPECTED_OK(parsed);
    EXPECT_EQ(result->interchanges, parsed->interchanges);
}

// =============================================================================
// Parser Lifecycle
// =============================================================================

TEST_F(X12ParserTest, MovedParserKeepsConfiguration) {
    x12_parser original(parser_options{.strict_envelope_validation = false});
    x12_parser moved(std::move(original));

    EXPECT_FALSE(moved.options().strict_envelope_validation);
    EXPECT_EXPECTED_OK(moved.parse(SEGMENT_COUNT_MISMATCH));
}

TEST_F(X12ParserTest, ConcurrentParsesShareOneParser) {
    constexpr int thread_count = 4;
    constexpr int iterations = 50;
    std::atomic<int> successes{0};

    std::vector<std::thread> threads;
    for (int t = 0; t < thread_count; ++t) {
        threads.emplace_back([&] {
            for (int i = 0; i < iterations; ++i) {
                auto result = parser_.parse(MULTI_INTERCHANGE);
                if (result && result->transaction_count() == 4) {
                    ++successes;
                }
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(successes.load(), thread_count * iterations);
}

}  // namespace
}  // namespace edi::x12::test
