#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

#include "support/recording_logger.hpp"
#include "tre/feed/csv_match_feed.hpp"

using namespace tre::feed;
using tre::foundation::ErrorCode;
using tre::foundation::parseDate;

// --- splitCsvLine ---

TEST(SplitCsvLineTest, TrimsUnquotedFields) {
    auto fields = splitCsvLine(" 2019-01-02 , Ana Ruiz,Bea Ito ,");
    ASSERT_EQ(fields.size(), 4u);
    EXPECT_EQ(fields[0], "2019-01-02");
    EXPECT_EQ(fields[1], "Ana Ruiz");
    EXPECT_EQ(fields[2], "Bea Ito");
    EXPECT_EQ(fields[3], "");
}

TEST(SplitCsvLineTest, QuotedFieldsKeepCommasAndEscapes) {
    auto fields = splitCsvLine(R"("Ruiz, Ana","say ""hi""", x)");
    ASSERT_EQ(fields.size(), 3u);
    EXPECT_EQ(fields[0], "Ruiz, Ana");
    EXPECT_EQ(fields[1], "say \"hi\"");
    EXPECT_EQ(fields[2], "x");
}

// --- PlayerDirectory ---

TEST(PlayerDirectoryTest, AssignsSequentialIds) {
    PlayerDirectory directory;
    auto ana = directory.intern("Ana Ruiz");
    auto bea = directory.intern("Bea Ito");
    EXPECT_EQ(ana.value(), 1u);
    EXPECT_EQ(bea.value(), 2u);
    EXPECT_EQ(directory.intern("Ana Ruiz"), ana);
    EXPECT_EQ(directory.size(), 2u);

    EXPECT_EQ(directory.find("Bea Ito"), bea);
    EXPECT_FALSE(directory.find("Cleo Park").has_value());
    EXPECT_EQ(directory.nameOf(bea).value_or(""), "Bea Ito");
    EXPECT_FALSE(directory.nameOf(tre::foundation::PlayerId(3)).has_value());
    EXPECT_FALSE(directory.nameOf(tre::foundation::PlayerId()).has_value());
}

// --- CsvMatchFeed ---

class CsvMatchFeedTest : public tre::test::LoggingTest {
protected:
    tre::foundation::EngineResult<void> read(const std::string& csv, Tier tier = Tier::Top) {
        std::istringstream in(csv);
        return feed_.read(in, tier, "test.csv");
    }

    PlayerDirectory directory_;
    CsvMatchFeed feed_{directory_};
};

TEST_F(CsvMatchFeedTest, ReadsFullRows) {
    ASSERT_TRUE(read("date,player_a,player_b,winner,score,tier,surface\n"
                     "2019-01-02,Ana Ruiz,Bea Ito,Bea Ito,6-4 6-3,top,Hard\n"
                     "2019-01-03,Ana Ruiz,Cleo Park,Ana Ruiz,6-4 6-7(3) 6-0,qualifying,clay\n")
                    .hasValue());
    auto matches = feed_.takeMatches();
    ASSERT_EQ(matches.size(), 2u);

    const auto& first = matches[0];
    EXPECT_TRUE(first.date == parseDate("2019-01-02").value());
    EXPECT_EQ(first.playerA, directory_.find("Ana Ruiz"));
    EXPECT_EQ(first.winner, directory_.find("Bea Ito"));
    EXPECT_FALSE(first.aWon());
    ASSERT_TRUE(first.score.has_value());
    EXPECT_EQ(first.score->gamesWon, 12u);
    EXPECT_EQ(first.tier, Tier::Top);
    EXPECT_EQ(first.surface, tre::rating::Surface::Hard);

    EXPECT_EQ(matches[1].tier, Tier::Qualifying);
    EXPECT_TRUE(matches[1].aWon());
    EXPECT_EQ(feed_.rowsSkipped(), 0u);
    EXPECT_EQ(logger_->countContaining("test.csv: 2 matches read as 'top' by default"), 1u);
}

TEST_F(CsvMatchFeedTest, HeaderIsCaseInsensitiveAndOrderFree) {
    ASSERT_TRUE(read("Winner,Date,Player_B,extra,Player_A\n"
                     "Bea Ito,2019-01-02,Bea Ito,zzz,Ana Ruiz\n")
                    .hasValue());
    auto matches = feed_.takeMatches();
    ASSERT_EQ(matches.size(), 1u);
    EXPECT_EQ(matches[0].playerA, directory_.find("Ana Ruiz"));
    EXPECT_EQ(matches[0].winner, matches[0].playerB);
}

TEST_F(CsvMatchFeedTest, MissingRequiredColumnFails) {
    auto result = read("date,player_a,player_b,score\n2019-01-02,A,B,6-0 6-0\n");
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::FeedMalformedHeader);
    EXPECT_NE(std::string(result.error().message()).find("winner"), std::string::npos);
}

TEST_F(CsvMatchFeedTest, EmptyInputFails) {
    auto result = read("");
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::FeedMalformedHeader);
}

TEST_F(CsvMatchFeedTest, EmptyTierTakesSourceDefault) {
    ASSERT_TRUE(read("date,player_a,player_b,winner,tier\n"
                     "2019-01-02,A,B,A,\n"
                     "2019-01-03,A,B,B,ITF\n",
                     Tier::Lower)
                    .hasValue());
    auto matches = feed_.takeMatches();
    ASSERT_EQ(matches.size(), 2u);
    EXPECT_EQ(matches[0].tier, Tier::Lower);
    EXPECT_EQ(matches[1].tier, Tier::Lower);
    EXPECT_FALSE(matches[0].score.has_value());
}

TEST_F(CsvMatchFeedTest, UnknownTierStopsTheRead) {
    auto result = read("date,player_a,player_b,winner,tier\n"
                       "2019-01-02,A,B,A,challenger\n");
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::UnknownTier);
    EXPECT_TRUE(result.error().isConfigurationError());
}

TEST_F(CsvMatchFeedTest, BadRowsAreSkippedWithWarnings) {
    ASSERT_TRUE(read("date,player_a,player_b,winner,score\n"
                     "2019-13-02,A,B,A,\n"
                     "2019-01-02,,B,B,\n"
                     "2019-01-03,A,A,A,\n"
                     "\n"
                     "2019-01-04,A,B,C,\n"
                     "2019-01-05,A,B,A,6-4 2-1 RET\n")
                    .hasValue());
    auto matches = feed_.takeMatches();
    ASSERT_EQ(matches.size(), 1u);
    EXPECT_FALSE(matches[0].score.has_value());

    EXPECT_EQ(feed_.rowsSkipped(), 4u);
    ASSERT_EQ(feed_.warnings().size(), 4u);
    EXPECT_EQ(feed_.warnings()[0].reason.rfind("test.csv:2: ", 0), 0u);
    EXPECT_EQ(feed_.warnings()[1].reason, "test.csv:3: missing player name");
    EXPECT_EQ(feed_.warnings()[2].reason, "test.csv:4: player 'A' listed on both sides");
    EXPECT_EQ(feed_.warnings()[3].reason, "test.csv:6: winner 'C' did not play this match");
    EXPECT_EQ(logger_->countContaining("[Feed] row skipped"), 4u);
    EXPECT_FALSE(directory_.find("C").has_value());
}

TEST_F(CsvMatchFeedTest, UnknownSurfaceKeepsRowWithWarning) {
    ASSERT_TRUE(read("date,player_a,player_b,winner,surface\n"
                     "2019-01-02,A,B,A,sand\n"
                     "2019-01-03,A,B,B,grass\n")
                    .hasValue());
    auto matches = feed_.takeMatches();
    ASSERT_EQ(matches.size(), 2u);
    EXPECT_FALSE(matches[0].surface.has_value());
    EXPECT_EQ(matches[1].surface, tre::rating::Surface::Grass);

    EXPECT_EQ(feed_.rowsSkipped(), 0u);
    ASSERT_EQ(feed_.warnings().size(), 1u);
    const auto& warning = feed_.warnings()[0];
    EXPECT_EQ(warning.reason, "test.csv:2: unknown surface 'sand'");
    EXPECT_EQ(warning.playerA, directory_.find("A"));
    EXPECT_EQ(warning.playerB, directory_.find("B"));
    ASSERT_TRUE(warning.date.has_value());
    EXPECT_TRUE(*warning.date == parseDate("2019-01-02").value());
    EXPECT_EQ(logger_->countContaining("[Feed] row kept with warning"), 1u);
    EXPECT_EQ(logger_->countContaining("match_date=2019-01-02"), 1u);
    EXPECT_EQ(logger_->countContaining("row skipped"), 0u);
}

TEST_F(CsvMatchFeedTest, SourcesMergeStablyByDate) {
    ASSERT_TRUE(read("date,player_a,player_b,winner\n"
                     "2019-01-05,A,B,A\n"
                     "2019-01-01,A,C,C\n",
                     Tier::Lower)
                    .hasValue());
    ASSERT_TRUE(read("date,player_a,player_b,winner\n"
                     "2019-01-01,D,E,D\n"
                     "2019-01-03,D,A,A\n",
                     Tier::Top)
                    .hasValue());

    auto matches = feed_.takeMatches();
    ASSERT_EQ(matches.size(), 4u);
    EXPECT_EQ(matches[0].playerB, directory_.find("C"));
    EXPECT_EQ(matches[0].tier, Tier::Lower);
    EXPECT_EQ(matches[1].playerA, directory_.find("D"));
    EXPECT_EQ(matches[1].tier, Tier::Top);
    EXPECT_EQ(matches[2].playerA, directory_.find("D"));
    EXPECT_EQ(matches[3].playerB, directory_.find("B"));
    EXPECT_TRUE(feed_.takeMatches().empty());
}

TEST_F(CsvMatchFeedTest, ReadFileReportsMissingFile) {
    MatchSource source;
    source.path = std::filesystem::temp_directory_path() / "tre_no_such_feed.csv";
    auto result = feed_.readFile(source);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::FeedOpenFailed);
}

TEST_F(CsvMatchFeedTest, ReadFileLabelsWarningsWithFileName) {
    auto path = std::filesystem::temp_directory_path() / "tre_feed_label.csv";
    {
        std::ofstream ofs(path);
        ofs << "date,player_a,player_b,winner\n2019-01-02,A,B,Z\n";
    }
    MatchSource source{Tier::Lower, path};
    ASSERT_TRUE(feed_.readFile(source).hasValue());
    ASSERT_EQ(feed_.warnings().size(), 1u);
    EXPECT_EQ(feed_.warnings()[0].reason.rfind("tre_feed_label.csv:2: ", 0), 0u);

    std::error_code ec;
    std::filesystem::remove(path, ec);
}
