//
// Created by gregorian-rayne on 12/29/25.
//

#include "cova/utils/path_utils.hpp"

#include <gtest/gtest.h>

namespace cova::path_utils
{
    TEST(PathUtilsTest, NormalizeCollapsesDots) {
        EXPECT_EQ(normalize("src/./Api/../Core/File.cs"), fs::path("src/Core/File.cs"));
        EXPECT_EQ(normalize("../shared/Util.cs"), fs::path("../shared/Util.cs"));
        EXPECT_EQ(normalize("a/.."), fs::path("."));
    }

    TEST(PathUtilsTest, ForwardSlashes) {
        EXPECT_EQ(to_forward_slashes(fs::path("src\\Api\\Program.cs")), "src/Api/Program.cs");
    }

    TEST(PathUtilsTest, NormalizeReportPath) {
        EXPECT_EQ(normalize_report_path("src\\Api\\..\\Core\\Service.cs"), "src/Core/Service.cs");
        EXPECT_EQ(normalize_report_path("/repo/./src/File.cs"), "/repo/src/File.cs");
        EXPECT_EQ(normalize_report_path(""), "");
    }
}  // namespace cova::path_utils
