#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <cstdio>
#include <string>

#include "oncal/calendar/expression.hpp"

using namespace oncal;
using ::testing::HasSubstr;

class ExpressionTest : public ::testing::Test {
protected:
    // Checks the fields named in `fields` (w y m d H M S) hold defaults
    void expectDefaults(const Specification& spec, std::string_view fields) {
        for (char field : fields) {
            switch (field) {
                case 'w':
                    EXPECT_EQ(spec.weekdays, WeekdaySet::full());
                    break;
                case 'y':
                    EXPECT_EQ(spec.years, YearSet::range(1970, 2200));
                    break;
                case 'm':
                    EXPECT_EQ(spec.months, MonthSet::range(1, 12));
                    break;
                case 'd':
                    EXPECT_EQ(spec.days, DaySet::range(1, 31));
                    break;
                case 'H':
                    EXPECT_EQ(spec.hours, HourSet({0}));
                    break;
                case 'M':
                    EXPECT_EQ(spec.minutes, MinuteSet({0}));
                    break;
                case 'S':
                    EXPECT_EQ(spec.seconds, SecondSet({0}));
                    break;
                default:
                    FAIL() << "unknown field " << field;
            }
        }
    }

    template <typename Error>
    auto expectFailure(const std::string& expression) -> std::string {
        try {
            (void)parseExpression(expression);
        } catch (const Error& e) {
            return e.getMessage();
        } catch (const std::exception& e) {
            ADD_FAILURE() << "'" << expression
                          << "' raised the wrong error: " << e.what();
            return {};
        }
        ADD_FAILURE() << "'" << expression << "' was accepted";
        return {};
    }
};

TEST_F(ExpressionTest, DefaultSpecification) {
    Specification spec;
    expectDefaults(spec, "wymdHMS");
    EXPECT_EQ(spec.years.size(), 231U);
}

TEST_F(ExpressionTest, ParsesStars) {
    auto spec = parseExpression("*-*-* *:*:*");
    expectDefaults(spec, "wymd");
    EXPECT_EQ(spec.hours, HourSet::full());
    EXPECT_EQ(spec.minutes, MinuteSet::full());
    EXPECT_EQ(spec.seconds, SecondSet::full());
}

TEST_F(ExpressionTest, ParsesWeekday) {
    for (const char* sample : {"Mon", "MON", "Monday", "MONDAY"}) {
        auto spec = parseExpression(sample);
        expectDefaults(spec, "ymdHMS");
        EXPECT_EQ(spec.weekdays, WeekdaySet({0})) << sample;
    }
}

TEST_F(ExpressionTest, ParsesWeekdayWithTrailingComma) {
    auto spec = parseExpression("Mon, 12:34");
    expectDefaults(spec, "ymdS");
    EXPECT_EQ(spec.weekdays, WeekdaySet({0}));
    EXPECT_EQ(spec.hours, HourSet({12}));
    EXPECT_EQ(spec.minutes, MinuteSet({34}));
}

TEST_F(ExpressionTest, ParsesWeekdayInterval) {
    for (const char* sample : {"Mon..Tue", "Mon,Tue", "Mon-Tue"}) {
        auto spec = parseExpression(sample);
        expectDefaults(spec, "ymdHMS");
        EXPECT_EQ(spec.weekdays, WeekdaySet({0, 1})) << sample;
    }
}

TEST_F(ExpressionTest, ParsesDate) {
    auto spec = parseExpression("2023-11-30");
    expectDefaults(spec, "wHMS");
    EXPECT_EQ(spec.years, YearSet({2023}));
    EXPECT_EQ(spec.months, MonthSet({11}));
    EXPECT_EQ(spec.days, DaySet({30}));
}

TEST_F(ExpressionTest, HandlesOmittedYear) {
    auto spec = parseExpression("11-30");
    expectDefaults(spec, "wyHMS");
    EXPECT_EQ(spec.months, MonthSet({11}));
    EXPECT_EQ(spec.days, DaySet({30}));
}

TEST_F(ExpressionTest, HandlesTwoDigitYears) {
    auto spec = parseExpression("69-*-*");
    expectDefaults(spec, "wmdHMS");
    EXPECT_EQ(spec.years, YearSet({2069}));

    spec = parseExpression("70-*-*");
    expectDefaults(spec, "wmdHMS");
    EXPECT_EQ(spec.years, YearSet({1970}));

    for (int year = 0; year < 100; ++year) {
        char text[16];
        std::snprintf(text, sizeof(text), "%02d-1-1", year);
        auto parsed = parseExpression(text);
        int expected = year < 70 ? 2000 + year : 1900 + year;
        EXPECT_EQ(parsed.years, YearSet({expected})) << text;
    }
}

TEST_F(ExpressionTest, ParsesTime) {
    auto spec = parseExpression("11:22:33");
    expectDefaults(spec, "wymd");
    EXPECT_EQ(spec.hours, HourSet({11}));
    EXPECT_EQ(spec.minutes, MinuteSet({22}));
    EXPECT_EQ(spec.seconds, SecondSet({33}));
}

TEST_F(ExpressionTest, HandlesOmittedSeconds) {
    auto spec = parseExpression("11:22");
    expectDefaults(spec, "wymdS");
    EXPECT_EQ(spec.hours, HourSet({11}));
    EXPECT_EQ(spec.minutes, MinuteSet({22}));
}

TEST_F(ExpressionTest, ParsesListsIntervalsAndSteps) {
    EXPECT_EQ(parseExpression("*:1,2,3").minutes, MinuteSet({1, 2, 3}));
    EXPECT_EQ(parseExpression("*:1..3").minutes, MinuteSet({1, 2, 3}));
    EXPECT_EQ(parseExpression("*:1..3,7..9:*").minutes,
              MinuteSet({1, 2, 3, 7, 8, 9}));
    EXPECT_EQ(parseExpression("*:0/15").minutes, MinuteSet({0, 15, 30, 45}));
    EXPECT_EQ(parseExpression("*:0..10/2").minutes,
              MinuteSet({0, 2, 4, 6, 8, 10}));
    EXPECT_EQ(parseExpression("*:5/15").minutes, MinuteSet({5, 20, 35, 50}));
}

TEST_F(ExpressionTest, ParsesDaysFromEnd) {
    EXPECT_EQ(parseExpression("*-*~1").days, DaySet({-1}));
    EXPECT_EQ(parseExpression("*~1").days, DaySet({-1}));
    EXPECT_EQ(parseExpression("*-*~1,8").days, DaySet({-1, -8}));
    EXPECT_EQ(parseExpression("*-*~1..3").days, DaySet({-1, -2, -3}));
    EXPECT_EQ(parseExpression("*-*~1..2,4..5").days,
              DaySet({-1, -2, -4, -5}));
    EXPECT_EQ(parseExpression("*-*~1..5/2").days, DaySet({-1, -3, -5}));
    EXPECT_EQ(parseExpression("*-*~3/2").days, DaySet({-1, -3}));

    auto spec = parseExpression("2020-02~1");
    EXPECT_EQ(spec.years, YearSet({2020}));
    EXPECT_EQ(spec.months, MonthSet({2}));
    EXPECT_EQ(spec.days, DaySet({-1}));
}

TEST_F(ExpressionTest, ComponentsAreClassifiedByShape) {
    auto ordered = parseExpression("Fri 2024-*-13 13:00");
    auto shuffled = parseExpression("13:00 2024-*-13 Fri");
    EXPECT_EQ(ordered, shuffled);
    EXPECT_EQ(ordered.weekdays, WeekdaySet({4}));
    EXPECT_EQ(ordered.days, DaySet({13}));
    EXPECT_EQ(ordered.hours, HourSet({13}));
}

TEST_F(ExpressionTest, ClassifyComponent) {
    EXPECT_EQ(classifyComponent("Mon"), ComponentKind::Weekday);
    EXPECT_EQ(classifyComponent("Mon-Fri"), ComponentKind::Weekday);
    EXPECT_EQ(classifyComponent("sat,"), ComponentKind::Weekday);
    EXPECT_EQ(classifyComponent("*"), ComponentKind::Weekday);
    EXPECT_EQ(classifyComponent("2019-01-01"), ComponentKind::Date);
    EXPECT_EQ(classifyComponent("*~1"), ComponentKind::Date);
    EXPECT_EQ(classifyComponent("8..9:0:0"), ComponentKind::Time);
    EXPECT_EQ(classifyComponent("*-*-1:1"), ComponentKind::Unrecognized);
    EXPECT_EQ(classifyComponent(""), ComponentKind::Unrecognized);
}

TEST_F(ExpressionTest, ParsesShorthands) {
    for (const char* sample :
         {"minutely", "Minutely", "MINUTELY", "MiNuTeLY", "  minutely "}) {
        auto spec = parseExpression(sample);
        expectDefaults(spec, "wymd");
        EXPECT_EQ(spec.hours, HourSet::full()) << sample;
        EXPECT_EQ(spec.minutes, MinuteSet::full()) << sample;
        EXPECT_EQ(spec.seconds, SecondSet({0})) << sample;
    }
}

TEST_F(ExpressionTest, ShorthandsMatchLongForms) {
    EXPECT_EQ(parseExpression("hourly"), parseExpression("*-*-* *:00:00"));
    EXPECT_EQ(parseExpression("daily"), parseExpression("*-*-* 00:00:00"));
    EXPECT_EQ(parseExpression("weekly"), parseExpression("Mon *-*-* 00:00"));
    EXPECT_EQ(parseExpression("monthly"), parseExpression("*-*-01 00:00"));
    EXPECT_EQ(parseExpression("yearly"), parseExpression("*-01-01 00:00"));
    EXPECT_EQ(parseExpression("annually"), parseExpression("yearly"));
    EXPECT_EQ(parseExpression("quarterly"),
              parseExpression("*-01,04,07,10-01 00:00:00"));
    EXPECT_EQ(parseExpression("semiannually"),
              parseExpression("*-01,07-01 00:00:00"));
    EXPECT_FALSE(shorthandSpecification("fortnightly").has_value());
}

TEST_F(ExpressionTest, RejectsWrongNumberOfFields) {
    EXPECT_THAT(expectFailure<FieldCountError>(""),
                HasSubstr("Wrong number of fields"));
    EXPECT_THAT(expectFailure<FieldCountError>("   "),
                HasSubstr("Wrong number of fields"));
    EXPECT_THAT(
        expectFailure<FieldCountError>("Mon *-*-* *:*:* surprise"),
        HasSubstr("Wrong number of fields"));
}

TEST_F(ExpressionTest, RejectsDuplicateRoles) {
    (void)expectFailure<FieldCountError>("Mon Tue");
    (void)expectFailure<FieldCountError>("1-1 2-2");
    (void)expectFailure<FieldCountError>("1:1 2:2");
    (void)expectFailure<FieldCountError>("*-*-1:1");
}

TEST_F(ExpressionTest, RejectsBadValuesInEveryPosition) {
    const char* patterns[] = {"%s *-*-* *:*:*", "%s-*-*", "*-%s-*",
                              "*-*-%s",         "*-*~%s", "%s:*:*",
                              "*:%s:*",         "*:*:%s"};
    const char* badValues[] = {"-1",    "1000", "ABC", "1-1", "1:1",
                               "Mon/1", "~1",   "*/1", "*,1", "1..*"};

    for (const char* pattern : patterns) {
        for (const char* value : badValues) {
            char expression[64];
            std::snprintf(expression, sizeof(expression), pattern, value);
            EXPECT_THROW((void)parseExpression(expression), ParseError)
                << expression;
        }
    }
}

TEST_F(ExpressionTest, RejectsLopsidedRange) {
    EXPECT_THAT(expectFailure<BadFieldError>("*-*-5..1"),
                HasSubstr("Bad day-of-month"));
}

TEST_F(ExpressionTest, RejectsUnderscores) {
    EXPECT_THAT(expectFailure<BadFieldError>("*:1..1_0"),
                HasSubstr("Bad minute"));
}

TEST_F(ExpressionTest, RejectsZeroStep) {
    EXPECT_THAT(expectFailure<BadFieldError>("*:*/0"), HasSubstr("Bad minute"));
}

TEST_F(ExpressionTest, ChecksDayOfMonthRange) {
    EXPECT_THAT(expectFailure<BadFieldError>("1-32"),
                HasSubstr("Bad day-of-month"));
}

TEST_F(ExpressionTest, RejectsWeekdayStar) {
    EXPECT_THAT(expectFailure<BadFieldError>("* 1-1"),
                HasSubstr("Bad day-of-week"));
}

TEST_F(ExpressionTest, RejectsReverseDayAbove28) {
    EXPECT_THAT(expectFailure<BadFieldError>("1~29"),
                HasSubstr("Bad day-of-month"));
}

TEST_F(ExpressionTest, ExtraSeparatorsSurfaceAsBadFields) {
    EXPECT_THAT(expectFailure<BadFieldError>("2020-1-1-1"),
                HasSubstr("Bad day-of-month"));
    EXPECT_THAT(expectFailure<BadFieldError>("1:2:3:4"),
                HasSubstr("Bad second"));
    EXPECT_THAT(expectFailure<BadFieldError>("-1-*-*"), HasSubstr("Bad year"));
}

TEST_F(ExpressionTest, ParsingIsDeterministic) {
    for (const char* sample :
         {"Mon..Fri *-*~7/1 8..17:0/15", "2019-01-01 8..9:0:0", "minutely",
          "Sun *~7/1", "*:*:0/5"}) {
        EXPECT_EQ(parseExpression(sample), parseExpression(sample)) << sample;
    }
}

TEST_F(ExpressionTest, HugeStepsStayInsideTheirField) {
    auto spec = parseExpression("1970/2147483647-*-* *:5/2147483647");
    EXPECT_EQ(spec.years, YearSet({1970}));
    EXPECT_EQ(spec.minutes, MinuteSet({5}));
    EXPECT_EQ(spec.seconds, SecondSet({0}));
}
