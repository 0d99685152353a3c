#include <gtest/gtest.h>
#include <naming/naming.hpp>
#include <cctype>

using namespace naming;

// ── Basic forms ─────────────────────────────────────────────

TEST(Naming, SnakeInputToAllForms) {
    EXPECT_EQ(to_pascal("user_profile"), "UserProfile");
    EXPECT_EQ(to_camel("user_profile"), "userProfile");
    EXPECT_EQ(to_snake("user_profile"), "user_profile");
}

TEST(Naming, PascalInputToSnake) {
    EXPECT_EQ(to_snake("UserProfile"), "user_profile");
    EXPECT_EQ(to_snake("Auth"), "auth");
}

TEST(Naming, SpaceAndDashSeparators) {
    EXPECT_EQ(to_pascal("user profile"), "UserProfile");
    EXPECT_EQ(to_camel("user-profile"), "userProfile");
    EXPECT_EQ(to_snake("user-profile"), "user_profile");
    EXPECT_EQ(to_snake("user profile"), "user_profile");
    EXPECT_EQ(to_snake("user -\t profile"), "user_profile");
}

TEST(Naming, EmptyInput) {
    EXPECT_EQ(to_pascal(""), "");
    EXPECT_EQ(to_camel(""), "");
    EXPECT_EQ(to_snake(""), "");
}

// ── Capitalization policy ───────────────────────────────────

TEST(Naming, CapitalizeLowersRemainder) {
    EXPECT_EQ(capitalize("XML"), "Xml");
    EXPECT_EQ(capitalize("hello"), "Hello");
    EXPECT_EQ(capitalize("x"), "X");
    EXPECT_EQ(capitalize(""), "");
}

TEST(Naming, SingleMixedCaseWordIsFlattened) {
    // Words are only found at separators, so embedded capitals are lost
    EXPECT_EQ(to_pascal("UserProfile"), "Userprofile");
    EXPECT_EQ(to_camel("UserProfile"), "userprofile");
    EXPECT_EQ(to_pascal("xml_http_request"), "XmlHttpRequest");
    EXPECT_EQ(to_pascal("XML_parser"), "XmlParser");
}

TEST(Naming, DigitsPassThrough) {
    EXPECT_EQ(to_pascal("oauth2_token"), "Oauth2Token");
    EXPECT_EQ(to_camel("2fa_code"), "2faCode");
    EXPECT_EQ(to_snake("oauth2_token"), "oauth2_token");
}

TEST(Naming, NonAsciiBytesUntouched) {
    EXPECT_EQ(to_snake("caf\xc3\xa9"), "caf\xc3\xa9");
    EXPECT_EQ(to_pascal("caf\xc3\xa9_menu"), "Caf\xc3\xa9Menu");
}

// ── Word splitting ──────────────────────────────────────────

TEST(Naming, SplitCollapsesSeparatorRuns) {
    auto words = split_words("user__profile--page");
    ASSERT_EQ(words.size(), 3u);
    EXPECT_EQ(words[0], "user");
    EXPECT_EQ(words[1], "profile");
    EXPECT_EQ(words[2], "page");
}

TEST(Naming, SplitKeepsEdgeEmptyWords) {
    auto words = split_words("_user_");
    ASSERT_EQ(words.size(), 3u);
    EXPECT_EQ(words[0], "");
    EXPECT_EQ(words[1], "user");
    EXPECT_EQ(words[2], "");
}

TEST(Naming, LeadingSeparatorCapitalizesCamel) {
    // First word is empty, so the camel form starts with a capital
    EXPECT_EQ(to_camel("_user"), "User");
    EXPECT_EQ(to_pascal("_user"), "User");
}

// ── Pascal / camel agreement ────────────────────────────────

TEST(Naming, PascalAndCamelDifferOnlyInFirstChar) {
    const char* inputs[] = {
        "auth", "user_profile", "user profile", "my-name_thing",
        "XML", "order_line_item", "a", "Already_Pascal",
    };
    for (const char* input : inputs) {
        auto pascal = to_pascal(input);
        auto camel = to_camel(input);
        ASSERT_EQ(pascal.size(), camel.size()) << input;
        ASSERT_FALSE(pascal.empty()) << input;
        EXPECT_EQ(pascal[0], static_cast<char>(std::toupper(static_cast<unsigned char>(camel[0]))))
            << input;
        EXPECT_EQ(pascal.substr(1), camel.substr(1)) << input;
    }
}

// ── Snake idempotence and known divergences ─────────────────

TEST(Naming, SnakeIsIdempotentOnSnakeInput) {
    const char* inputs[] = {"user_profile", "auth", "order_line_item", "a1_b2"};
    for (const char* input : inputs) {
        EXPECT_EQ(to_snake(input), input);
        EXPECT_EQ(to_snake(to_snake(input)), to_snake(input));
    }
}

TEST(Naming, SnakeStripsOnlyOneLeadingUnderscore) {
    EXPECT_EQ(to_snake("_User"), "_user");
    EXPECT_EQ(to_snake("-user"), "user");
}

TEST(Naming, SnakeSplitsEveryCapital) {
    EXPECT_EQ(to_snake("XMLParser"), "x_m_l_parser");
}

TEST(Naming, SnakeKeepsUnderscoreRunsFromMixedInput) {
    // The inserted '_' before a capital is not merged with a neighbouring
    // separator, so these differ from to_snake(to_pascal(input)).
    EXPECT_EQ(to_snake("User Profile"), "user__profile");
    EXPECT_EQ(to_snake("My-Name_Thing"), "my__name__thing");
    EXPECT_EQ(to_pascal("My-Name_Thing"), "MyNameThing");
    EXPECT_EQ(to_snake(to_pascal("My-Name_Thing")), "my_name_thing");
}

TEST(Naming, DeriveMatchesIndividualFunctions) {
    auto forms = derive("order_item");
    EXPECT_EQ(forms.snake, "order_item");
    EXPECT_EQ(forms.pascal, "OrderItem");
    EXPECT_EQ(forms.camel, "orderItem");
}
