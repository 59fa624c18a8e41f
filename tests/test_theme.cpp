#include <gtest/gtest.h>
#include <cli/theme.hpp>

// Visible text with SGR sequences removed
static std::string plain(const std::string& s) {
    std::string out;
    for (size_t i = 0; i < s.size(); i++) {
        if (s[i] == '\033') {
            while (i < s.size() && s[i] != 'm') i++;
            continue;
        }
        out += s[i];
    }
    return out;
}

TEST(ThemeTest, MeterFillsProportionally) {
    EXPECT_EQ(plain(theme::meter(50, 10)), "[#####.....] 50.0%");
    EXPECT_EQ(plain(theme::meter(0, 4)), "[....] 0.0%");
    EXPECT_EQ(plain(theme::meter(250, 4)), "[####] 100.0%");
}

TEST(ThemeTest, MeterTintFollowsLoad) {
    EXPECT_NE(theme::meter(20).find(theme::escape(theme::Tone::Good)), std::string::npos);
    EXPECT_NE(theme::meter(75).find(theme::escape(theme::Tone::Warn)), std::string::npos);
    EXPECT_NE(theme::meter(95).find(theme::escape(theme::Tone::Bad)), std::string::npos);
}

TEST(ThemeTest, RowsAlignColumns) {
    EXPECT_EQ(plain(theme::command_row("ls", "List a directory", 6)), "    ls    List a directory\n");
    EXPECT_EQ(plain(theme::kv("Uptime", "3 days")), "    Uptime    3 days\n");
    EXPECT_EQ(plain(theme::ok("done")), "    + done\n");
}
