#include "csvsed/parsers/modifier_parser.hpp"
#include "csvsed/core/errors.hpp"
#include <gmock/gmock.h>
#include <gtest/gtest.h>

namespace csvsed {

class ModifierParserTest : public ::testing::Test {
protected:
    ModifierParser parser_;

    auto error_for(const std::string& spec) -> std::string {
        try {
            parser_.parse(spec);
        } catch (const InvalidModifierError& e) {
            EXPECT_EQ(e.modifier(), spec);
            return e.what();
        }
        ADD_FAILURE() << "expected InvalidModifierError for " << spec;
        return "";
    }
};

TEST_F(ModifierParserTest, SelectsOperatorByTypeCharacter)
{
    EXPECT_EQ(modifier_kind(parser_.parse("s/a/b/")), ModifierKind::SUBSTITUTE);
    EXPECT_EQ(modifier_kind(parser_.parse("y/a/b/")), ModifierKind::TRANSLITERATE);
    EXPECT_EQ(modifier_kind(parser_.parse("e/cat/")), ModifierKind::EXECUTE);
}

TEST_F(ModifierParserTest, KeepsRawSpecification)
{
    auto modifier = parser_.parse("s|a|b|g");
    EXPECT_EQ(modifier_spec(modifier), "s|a|b|g");
}

TEST_F(ModifierParserTest, RejectsEmptyModifier)
{
    EXPECT_THAT(error_for(""), testing::HasSubstr("empty modifier"));
}

TEST_F(ModifierParserTest, RejectsUnsupportedType)
{
    EXPECT_THAT(error_for("x/a/b/"), testing::HasSubstr("unsupported modifier type 'x'"));
}

TEST_F(ModifierParserTest, RejectsTooShortInput)
{
    EXPECT_THAT(error_for("s/a"), testing::HasSubstr("does not match expected form \"s/REGEX/REPL/FLAGS\""));
    EXPECT_THAT(error_for("e/"), testing::HasSubstr("e/COMMAND/"));
    EXPECT_THAT(error_for("s"), testing::HasSubstr("does not match expected form"));
}

TEST_F(ModifierParserTest, RejectsWrongPartCount)
{
    EXPECT_THAT(error_for("s/a/b"), testing::HasSubstr("\"s/REGEX/REPL/FLAGS\""));
    EXPECT_THAT(error_for("s/a/b/c/d"), testing::HasSubstr("does not match expected form"));
    EXPECT_THAT(error_for("e/cat"), testing::HasSubstr("\"e/COMMAND/\""));
}

TEST_F(ModifierParserTest, ExpectedFormUsesSpecDelimiter)
{
    EXPECT_THAT(error_for("s|a|b"), testing::HasSubstr("\"s|REGEX|REPL|FLAGS\""));
    EXPECT_THAT(error_for("y,a,b"), testing::HasSubstr("\"y,SOURCE,DEST,FLAGS\""));
}

TEST_F(ModifierParserTest, RequiresLeftHandSide)
{
    EXPECT_THAT(error_for("s//b/"), testing::HasSubstr("no previous regular expression"));
    EXPECT_THAT(error_for("y//b/"), testing::HasSubstr("no previous regular expression"));
}

TEST_F(ModifierParserTest, AcceptsAllSubstituteFlags)
{
    EXPECT_NO_THROW(parser_.parse("s/a/b/iglmsux"));
}

TEST_F(ModifierParserTest, RejectsUnknownSubstituteFlag)
{
    auto message = error_for("s/a/b/gq");
    EXPECT_THAT(message, testing::HasSubstr("unsupported flag 'q'"));
    EXPECT_THAT(message, testing::HasSubstr("supports the flags 'i', 'g', 'l', 'm', 's', 'u', 'x'"));
}

TEST_F(ModifierParserTest, RejectsUnknownTransliterateFlag)
{
    auto message = error_for("y/a/b/g");
    EXPECT_THAT(message, testing::HasSubstr("unsupported flag 'g'"));
    EXPECT_THAT(message, testing::HasSubstr("supports only the flag 'i'"));
}

TEST_F(ModifierParserTest, ExecuteTakesNoFlags)
{
    auto message = error_for("e/cat/c");
    EXPECT_THAT(message, testing::HasSubstr("unsupported flag 'c'"));
    EXPECT_THAT(message, testing::HasSubstr("takes no flags"));
}

TEST_F(ModifierParserTest, ReportsRegexCompilationFailure)
{
    auto message = error_for("s/(unclosed/x/");
    EXPECT_THAT(message, testing::HasSubstr("cannot compile regular expression"));
}

TEST_F(ModifierParserTest, ReportsInvalidGroupReference)
{
    EXPECT_THAT(error_for("s/(a)/\\2/"), testing::HasSubstr("invalid group reference 2"));
    EXPECT_THAT(error_for("s/(a)/\\g<x>/"), testing::HasSubstr("bad group reference"));
}

TEST_F(ModifierParserTest, GlobalFlagControlsCount)
{
    auto first_only = std::get<SubstituteModifier>(parser_.parse("s/a/b/"));
    auto global = std::get<SubstituteModifier>(parser_.parse("s/a/b/g"));

    EXPECT_EQ(first_only.count, 1);
    EXPECT_EQ(global.count, 0);
}

TEST_F(ModifierParserTest, TransliterateRequiresEqualLengths)
{
    EXPECT_THAT(error_for("y/abc/de/"), testing::HasSubstr("source and destination must have equal length"));
    EXPECT_THAT(error_for("y/a-z/A-Y/"), testing::HasSubstr("26 != 25"));
}

TEST_F(ModifierParserTest, TransliterateBackwardsRangeIsInvalidModifier)
{
    EXPECT_THAT(error_for("y/z-a/a-z/"), testing::HasSubstr("invalid range \"z-a\""));
}

TEST_F(ModifierParserTest, TransliterateCaseInsensitiveCoversBothCases)
{
    auto modifier = std::get<TransliterateModifier>(parser_.parse("y/abc/def/i"));

    EXPECT_EQ(modifier.table.size(), 6);
    EXPECT_EQ(modifier.table.at(U'A'), U'd');
    EXPECT_EQ(modifier.table.at(U'c'), U'f');
}

TEST_F(ModifierParserTest, ExecuteStoresCommandVerbatim)
{
    auto modifier = std::get<ExecuteModifier>(parser_.parse("e|tr ab xy|"));

    EXPECT_EQ(modifier.command, "tr ab xy");
    EXPECT_NE(modifier.runner, nullptr);
    EXPECT_EQ(modifier.timeout, DEFAULT_COMMAND_TIMEOUT);
}

TEST_F(ModifierParserTest, ExecutePropagatesConfiguredTimeout)
{
    ModifierParser parser(ParserOptions{.runner = nullptr, .command_timeout = std::chrono::milliseconds(250)});
    auto modifier = std::get<ExecuteModifier>(parser.parse("e/cat/"));

    EXPECT_EQ(modifier.timeout, std::chrono::milliseconds(250));
}

TEST_F(ModifierParserTest, NonAsciiDelimiter)
{
    auto modifier = parser_.parse("s§a§b§g");
    EXPECT_EQ(apply_modifier(modifier, "aaa"), "bbb");
}

} // namespace csvsed
