//
// Created by gregorian-rayne on 10/19/26.
//

#include "eca/context/source_scanner.hpp"
#include "order_service_fixture.hpp"

#include <gtest/gtest.h>

namespace eca::context
{
    namespace {
        const auto& lines() {
            return test::order_service_lines();
        }
    }

    TEST(SourceScannerTest, EnclosingClass) {
        EXPECT_EQ(find_enclosing_class(lines(), 23).value(), "OrderService");
        EXPECT_EQ(find_enclosing_class(lines(), 29).value(), "Helper");
        EXPECT_FALSE(find_enclosing_class(lines(), 3).has_value());
    }

    TEST(SourceScannerTest, EnclosingMethodFromInsideBody) {
        for (const int target : {15, 17, 19, 21, 23}) {
            const auto bounds = find_enclosing_method(lines(), target);
            ASSERT_TRUE(bounds.has_value()) << "line " << target;
            EXPECT_EQ(bounds->name, "processOrder");
            EXPECT_EQ(bounds->start_line, 15);
            EXPECT_EQ(bounds->end_line, 25);
        }
    }

    TEST(SourceScannerTest, StatementsAreNotDeclarations) {
        const std::vector<std::string> source = {
            "void run() {",
            "    return compute(x);",
            "}",
        };

        const auto bounds = find_enclosing_method(source, 2);
        ASSERT_TRUE(bounds.has_value());
        EXPECT_EQ(bounds->name, "run");
    }

    TEST(SourceScannerTest, NestedClassMethod) {
        const auto bounds = find_enclosing_method(lines(), 29);
        ASSERT_TRUE(bounds.has_value());
        EXPECT_EQ(bounds->name, "help");
        EXPECT_EQ(bounds->start_line, 28);
        EXPECT_EQ(bounds->end_line, 30);
    }

    TEST(SourceScannerTest, NoMethodOutsideBodies) {
        EXPECT_FALSE(find_enclosing_method(lines(), 7).has_value());
        EXPECT_FALSE(find_enclosing_method(lines(), 0).has_value());
        EXPECT_FALSE(find_enclosing_method(lines(), 33).has_value());
    }

    TEST(SourceScannerTest, MethodBodyIsFullText) {
        const MethodBounds bounds{"processOrder", 15, 25};
        const auto body = extract_method_body(lines(), bounds);

        std::string expected;
        for (int i = 15; i <= 25; ++i) {
            expected += lines()[static_cast<std::size_t>(i - 1)] + "\n";
        }
        EXPECT_EQ(body, expected);
    }

    TEST(SourceScannerTest, Imports) {
        const auto imports = extract_imports(lines());
        ASSERT_EQ(imports.size(), 2u);
        EXPECT_EQ(imports[0], "import java.util.List;");
        EXPECT_EQ(imports[1], "import java.util.Map;");
    }

    TEST(SourceScannerTest, ClassFieldsAtTopLevelOnly) {
        const auto fields = extract_class_fields(lines(), "OrderService");
        ASSERT_EQ(fields.size(), 2u);
        EXPECT_EQ(fields[0], "private final OrderRepository repository;");
        EXPECT_EQ(fields[1], "private int processed = 0;");

        EXPECT_TRUE(extract_class_fields(lines(), "Missing").empty());
    }

    TEST(SourceScannerTest, FieldsBeforeOpeningBrace) {
        const std::vector<std::string> source = {
            "public class Split",
            "{",
            "    private int count;",
            "}",
        };

        const auto fields = extract_class_fields(source, "Split");
        ASSERT_EQ(fields.size(), 1u);
        EXPECT_EQ(fields[0], "private int count;");
    }

    TEST(SourceScannerTest, ContextWindow) {
        const auto context = extract_context("OrderService.java", lines(), 23, 3);

        ASSERT_TRUE(context.has_value());
        EXPECT_EQ(context->target_line, 23);
        EXPECT_EQ(context->start_line, 20);
        EXPECT_EQ(context->end_line, 26);
        ASSERT_EQ(context->surrounding_lines.size(), 7u);
        EXPECT_EQ(context->surrounding_lines.front(), lines()[19]);
        EXPECT_EQ(context->class_name.value(), "OrderService");
        EXPECT_EQ(context->method_name.value(), "processOrder");
        EXPECT_EQ(context->imports.size(), 2u);
        EXPECT_EQ(context->class_fields.size(), 2u);

        const auto formatted = context->formatted();
        EXPECT_NE(formatted.find(" >>>   23 |         processed++;"), std::string::npos);
        EXPECT_NE(formatted.find("       20 | "), std::string::npos);
    }

    TEST(SourceScannerTest, ContextWindowClampsToFile) {
        const auto context = extract_context("OrderService.java", lines(), 2, 10);

        ASSERT_TRUE(context.has_value());
        EXPECT_EQ(context->start_line, 1);
        EXPECT_EQ(context->end_line, 12);
        EXPECT_FALSE(context->method_name.has_value());
    }

    TEST(SourceScannerTest, OutOfRangeLine) {
        EXPECT_FALSE(extract_context("OrderService.java", lines(), 9999, 10).has_value());
        EXPECT_FALSE(extract_context("OrderService.java", lines(), 0, 10).has_value());
        EXPECT_FALSE(extract_context("Empty.java", {}, 1, 10).has_value());
    }
}
