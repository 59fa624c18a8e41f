#include <gtest/gtest.h>
#include <session/remote_info.hpp>

TEST(RemoteInfoTest, SectionsDoNotBleedIntoLongerNames) {
    std::string out =
        "MEMORY_PROCESSES_START\n1|a|0%|0%|1MB\nMEMORY_PROCESSES_END\n"
        "MEMORY_START\n10.0%|1GB|0.1GB|0.9GB\nMEMORY_END\n";
    EXPECT_EQ(extract_section(out, "MEMORY"), "10.0%|1GB|0.1GB|0.9GB");
    EXPECT_EQ(extract_section(out, "MEMORY_PROCESSES"), "1|a|0%|0%|1MB");
    EXPECT_EQ(extract_section(out, "UPTIME"), "");
    EXPECT_EQ(extract_section("CPU_START 5", "CPU"), "");
}

TEST(RemoteInfoTest, MissingSectionsKeepDefaults) {
    auto s = parse_system_status("UPTIME_START\nUPTIME_END\n");
    EXPECT_EQ(s.uptime, "N/A");
    EXPECT_EQ(s.ip, "N/A");
    EXPECT_DOUBLE_EQ(s.cpu_usage, 0.0);
    EXPECT_FALSE(s.memory.has_value());
    EXPECT_FALSE(s.root_disk.has_value());
    EXPECT_TRUE(s.top_cpu.empty());
}

TEST(RemoteInfoTest, RootDiskFallsBackToFirstMount) {
    auto s = parse_system_status(
        "MOUNTS_START\n/dev/vdb|10G|1G|9G|10%|/data\nbroken|row\n/dev/vdc|5G|4G|1G|80%|/srv\nMOUNTS_END\n");
    ASSERT_EQ(s.mounts.size(), 2u);
    ASSERT_TRUE(s.root_disk.has_value());
    EXPECT_EQ(s.root_disk->mount, "/data");

    auto r = parse_system_status(
        "MOUNTS_START\n/dev/vdb|10G|1G|9G|10%|/data\n/dev/vda|20G|2G|18G|10%|/\nMOUNTS_END\n");
    ASSERT_TRUE(r.root_disk.has_value());
    EXPECT_EQ(r.root_disk->filesystem, "/dev/vda");
}

TEST(RemoteInfoTest, CpuUsageIsClamped) {
    EXPECT_DOUBLE_EQ(parse_system_status("CPU_START\n130.2\nCPU_END").cpu_usage, 100.0);
    EXPECT_DOUBLE_EQ(parse_system_status("CPU_START\n-4\nCPU_END").cpu_usage, 0.0);
    EXPECT_DOUBLE_EQ(parse_system_status("CPU_START\nn/a\nCPU_END").cpu_usage, 0.0);
}

TEST(RemoteInfoTest, StatusCommandEmitsEverySection) {
    std::string cmd = system_status_command();
    for (const char* name : {"UPTIME", "MOUNTS", "IP", "CPU", "MEMORY", "PROCESSES", "MEMORY_PROCESSES"}) {
        EXPECT_NE(cmd.find(std::string("echo ") + name + "_START"), std::string::npos) << name;
        EXPECT_NE(cmd.find(std::string("echo ") + name + "_END"), std::string::npos) << name;
    }
    EXPECT_EQ(cmd.rfind("export LC_ALL=C", 0), 0u);
}

TEST(RemoteInfoTest, SearchCommandQuotesArguments) {
    EXPECT_EQ(search_command("/srv/my app", "it's", 5),
              "cd '/srv/my app' && grep -R -n --text -- 'it'\\''s' . | head -n 5");
}

TEST(RemoteInfoTest, SearchOutputSplitsOnLineNumber) {
    auto m = parse_search_output(
        "./a.txt:3:hello: world\r\n"
        "./run:dir/app.log:7:timestamped\n"
        "Binary file ./blob matches\n"
        "\n");
    ASSERT_EQ(m.size(), 2u);
    EXPECT_EQ(m[0].path, "a.txt");
    EXPECT_EQ(m[0].line, 3);
    EXPECT_EQ(m[0].text, "hello: world");
    EXPECT_EQ(m[1].path, "run:dir/app.log");
    EXPECT_EQ(m[1].line, 7);
    EXPECT_EQ(m[1].text, "timestamped");
}
