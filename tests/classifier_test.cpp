#include "classifier.hpp"
#include "common.hpp"

#include <gtest/gtest.h>

using Path = std::vector<std::string>;

TEST(ClassifierTest, PlainQutebrowserPage) {
    EXPECT_EQ(ClassifyWindowTitle("Where in the World: Tenaya and Climate Change - qutebrowser"),
              (Path{"qutebrowser", "Where in the World: Tenaya and Climate Change"}));
}

TEST(ClassifierTest, LoadingPercentageIsStripped) {
    EXPECT_EQ(
        ClassifyWindowTitle("[23%] Where in the World: Tenaya and Climate Change - qutebrowser"),
        (Path{"qutebrowser", "Where in the World: Tenaya and Climate Change"}));
    EXPECT_EQ(
        ClassifyWindowTitle("[0%] Where in the World: Tenaya and Climate Change - qutebrowser"),
        (Path{"qutebrowser", "Where in the World: Tenaya and Climate Change"}));
}

TEST(ClassifierTest, WorkChatMailAndCalendar) {
    EXPECT_EQ(ClassifyWindowTitle("(•) Rocket.Chat - qutebrowser"),
              (Path{"Blockstream", "Rocket.Chat"}));
    EXPECT_EQ(ClassifyWindowTitle("Rocket.Chat - qutebrowser"),
              (Path{"Blockstream", "Rocket.Chat"}));
    EXPECT_EQ(ClassifyWindowTitle(
                  "Inbox (10) - apoelstra@blockstream.com - Blockstream Mail - qutebrowser"),
              (Path{"Blockstream", "Gmail"}));
    EXPECT_EQ(ClassifyWindowTitle(
                  "Blockstream - Calendar - Tuesday, December 13, 2022, today - qutebrowser"),
              (Path{"Blockstream", "Calendar"}));
}

TEST(ClassifierTest, GithubNotifications) {
    EXPECT_EQ(ClassifyWindowTitle("Notifications - qutebrowser"),
              (Path{"Github", "Notifications"}));
}

TEST(ClassifierTest, GithubPullRequestIssueAndDiscussion) {
    EXPECT_EQ(ClassifyWindowTitle("Standardize derives on error types by tcharding · Pull "
                                  "Request #1466 · rust-bitcoin/rust-bitcoin - qutebrowser"),
              (Path{"Github", "rust-bitcoin/rust-bitcoin", "Pull Request",
                    "#1466 Standardize derives on error types by tcharding"}));
    EXPECT_EQ(ClassifyWindowTitle("TapTweak API for a single script path spending case · Issue "
                                  "#1393 · rust-bitcoin/rust-bitcoin - qutebrowser"),
              (Path{"Github", "rust-bitcoin/rust-bitcoin", "Issue",
                    "#1393 TapTweak API for a single script path spending case"}));
    EXPECT_EQ(ClassifyWindowTitle("[0%] Add Coin Selection Algos · Discussion #1402 · "
                                  "rust-bitcoin/rust-bitcoin - qutebrowser"),
              (Path{"Github", "rust-bitcoin/rust-bitcoin", "Discussion",
                    "#1402 Add Coin Selection Algos"}));
}

TEST(ClassifierTest, TmuxSessionAndWindow) {
    EXPECT_EQ(ClassifyWindowTitle("[mosh] urxvt (camus) - ../check-pr.sh pr/1467/head 1467 "
                                  "(tmux:work-rust-bitcoin/rust-bitcoin)"),
              (Path{"tmux", "work-rust-bitcoin", "rust-bitcoin",
                    "[mosh] urxvt (camus) - ../check-pr.sh pr/1467/head 1467"}));
}

TEST(ClassifierTest, UnknownTitleIsItsOwnLabel) {
    EXPECT_EQ(ClassifyWindowTitle("Terminal"), (Path{"Terminal"}));
}

TEST(ClassifierTest, LabelJoinsPathRootFirst) {
    EXPECT_EQ(ActivityLabelFor("Notifications - qutebrowser"), "Github / Notifications");
    EXPECT_EQ(ActivityLabelFor("  Terminal  "), "Terminal");
    EXPECT_EQ(ActivityLabelFor(""), "");
    EXPECT_EQ(ActivityLabelFor(" \t "), "");
}

TEST(ClassifierTest, PathDropsBlankComponents) {
    EXPECT_EQ(ActivityPathFor("  editor  "), (Path{"editor"}));
    EXPECT_TRUE(ActivityPathFor(" \t ").empty());
    EXPECT_EQ(JoinActivityPath({"a", "b", "c"}), "a / b / c");
}

TEST(ClassifierTest, Latin1TitleIsRepairedToUtf8) {
    // "café" in Latin-1
    EXPECT_EQ(ActivityLabelFor("caf\xe9 menu - xterm"), "caf\xEF\xBF\xBD menu - xterm");
}

TEST(Utf8Test, ValidTextIsUnchanged) {
    const std::string text = "plain \xC3\xA9 \xE2\x82\xAC \xF0\x9F\x8D\x85";
    EXPECT_EQ(ToValidUtf8(text), text);
    EXPECT_EQ(ToValidUtf8(""), "");
}

TEST(Utf8Test, IllFormedSequencesBecomeReplacementCharacters) {
    const std::string fffd = "\xEF\xBF\xBD";
    // stray continuation byte and an impossible lead byte
    EXPECT_EQ(ToValidUtf8("a\x80z"), "a" + fffd + "z");
    EXPECT_EQ(ToValidUtf8("a\xFFz"), "a" + fffd + "z");
    // overlong encoding of '/'
    EXPECT_EQ(ToValidUtf8("\xC0\xAF"), fffd + fffd);
    // UTF-16 surrogate
    EXPECT_EQ(ToValidUtf8("\xED\xA0\x80"), fffd + fffd + fffd);
    // truncated three-byte sequence counts once
    EXPECT_EQ(ToValidUtf8("\xE2\x82z"), fffd + "z");
    EXPECT_EQ(ToValidUtf8("end\xE2\x82"), "end" + fffd);
}
