// =============================================================================
// User Source Tests
// =============================================================================

#include <gtest/gtest.h>
#include "geoshard/error.hpp"
#include "geoshard/user_source.hpp"
#include <sstream>

using namespace geoshard;

class UserSourceTest : public ::testing::Test {
protected:
    std::vector<UserRecord> drain(UserSource& source) {
        std::vector<UserRecord> out;
        while (auto user = source.next()) {
            out.push_back(*user);
        }
        return out;
    }
};

TEST_F(UserSourceTest, VectorSource) {
    VectorUserSource source({UserRecord(LatLng(1, 2)), UserRecord(LatLng(3, 4), 7)});
    auto users = drain(source);
    ASSERT_EQ(users.size(), 2u);
    EXPECT_DOUBLE_EQ(users[1].location.lat_degrees, 3.0);
    EXPECT_EQ(users[1].weight, 7);
    EXPECT_FALSE(source.next().has_value());
}

TEST_F(UserSourceTest, EmptyVectorSource) {
    VectorUserSource source;
    EXPECT_FALSE(source.next().has_value());
}

TEST_F(UserSourceTest, CsvParsesRecords) {
    std::istringstream in(
        "lat,lng,weight\n"
        "# comment\n"
        "\n"
        "40.7128, -74.0060\n"
        "51.5074,-0.1278,5\n");
    CsvUserSource source(in);
    auto users = drain(source);

    ASSERT_EQ(users.size(), 2u);
    EXPECT_DOUBLE_EQ(users[0].location.lat_degrees, 40.7128);
    EXPECT_DOUBLE_EQ(users[0].location.lng_degrees, -74.0060);
    EXPECT_EQ(users[0].weight, 1);
    EXPECT_EQ(users[1].weight, 5);
    EXPECT_EQ(source.line_number(), 5u);
}

TEST_F(UserSourceTest, CsvMalformedLineReportsLineNumber) {
    std::istringstream in("10,20\n10;20\n");
    CsvUserSource source(in);
    ASSERT_TRUE(source.next().has_value());
    try {
        source.next();
        FAIL() << "expected IOError";
    } catch (const IOError& e) {
        EXPECT_EQ(e.context(), "line 2");
        EXPECT_EQ(e.code(), ErrorCode::IO);
    }
}

TEST_F(UserSourceTest, CsvRejectsBadValues) {
    {
        std::istringstream in("abc,20\n");
        CsvUserSource source(in);
        EXPECT_THROW(source.next(), IOError);
    }
    {
        std::istringstream in("95,20\n");
        CsvUserSource source(in);
        EXPECT_THROW(source.next(), IOError);
    }
    {
        std::istringstream in("10,20,heavy\n");
        CsvUserSource source(in);
        EXPECT_THROW(source.next(), IOError);
    }
    {
        std::istringstream in("10,20,1,2\n");
        CsvUserSource source(in);
        EXPECT_THROW(source.next(), IOError);
    }
}

TEST_F(UserSourceTest, CsvMissingFile) {
    EXPECT_THROW(CsvUserSource("/nonexistent/users.csv"), IOError);
}
