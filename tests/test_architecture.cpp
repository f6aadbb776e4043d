#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <sstream>

namespace fs = std::filesystem;

// The gateway only moves jobs; reasoning lives behind the job runner.
TEST(GatewayArchitecture, SourcesHaveNoModelRouterDependency) {
    fs::path root = fs::path(NOVAADAPT_SOURCE_DIR) / "services" / "gateway";
    ASSERT_TRUE(fs::exists(root)) << root;
    int scanned = 0;
    for (const auto& entry : fs::recursive_directory_iterator(root)) {
        if (!entry.is_regular_file()) continue;
        auto ext = entry.path().extension().string();
        if (ext != ".cpp" && ext != ".hpp") continue;
        std::ifstream in(entry.path());
        std::stringstream buf;
        buf << in.rdbuf();
        const std::string text = buf.str();
        EXPECT_EQ(text.find("ModelRouter"), std::string::npos) << entry.path();
        EXPECT_EQ(text.find("model_router"), std::string::npos) << entry.path();
        ++scanned;
    }
    EXPECT_GT(scanned, 0);
}
