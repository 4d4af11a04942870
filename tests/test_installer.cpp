#include <gtest/gtest.h>
#include "core/installer.hpp"
#include "fake_desktop.hpp"

#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

class InstallerTest : public ::testing::Test {
protected:
    std::string test_dir;
    FakeDesktop desktop;

    void SetUp() override {
        test_dir = (fs::temp_directory_path() / "vidgrab-test-installer").string();
        fs::create_directories(test_dir);
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }

    std::string make_artifact(const std::string& name) {
        std::string path = test_dir + "/" + name;
        std::ofstream out(path);
        out << "fake";
        return path;
    }
};

TEST_F(InstallerTest, IsDebPackage) {
    EXPECT_TRUE(Installer::is_deb_package("/tmp/vidgrab_2.3.0_amd64.deb"));
    EXPECT_TRUE(Installer::is_deb_package("/tmp/VIDGRAB.DEB"));
    EXPECT_FALSE(Installer::is_deb_package("/tmp/VidGrab.AppImage"));
    EXPECT_FALSE(Installer::is_deb_package("deb"));
}

TEST_F(InstallerTest, DebInstallCommandQuotesPath) {
    EXPECT_EQ(Installer::deb_install_command("/home/u/Downloads/vidgrab.deb"),
              "sudo dpkg -i '/home/u/Downloads/vidgrab.deb'");
    EXPECT_EQ(Installer::deb_install_command("/tmp/it's.deb"),
              "sudo dpkg -i '/tmp/it'\\''s.deb'");
}

TEST_F(InstallerTest, WindowsOpensInstallerAndQuits) {
    std::string path = make_artifact("VidGrab-Setup-2.3.0.exe");
    Installer installer(desktop, {"win32", "x64"}, std::chrono::milliseconds(1000));

    auto result = installer.install(path);
    ASSERT_TRUE(result.success) << result.error.message;
    EXPECT_EQ(result.outcome, InstallOutcome::LaunchedInstaller);
    ASSERT_EQ(desktop.opened.size(), 1u);
    EXPECT_EQ(desktop.opened[0], path);
    ASSERT_EQ(desktop.quit_requests.size(), 1u);
    EXPECT_EQ(desktop.quit_requests[0], std::chrono::milliseconds(1000));
}

TEST_F(InstallerTest, MacOpensImage) {
    std::string path = make_artifact("VidGrab-2.3.0.dmg");
    Installer installer(desktop, {"darwin", "arm64"});

    auto result = installer.install(path);
    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.outcome, InstallOutcome::LaunchedInstaller);
    EXPECT_EQ(desktop.opened.size(), 1u);
    EXPECT_EQ(desktop.quit_requests.size(), 1u);
}

TEST_F(InstallerTest, LinuxDebIsRevealedNotInstalled) {
    std::string path = make_artifact("vidgrab_2.3.0_amd64.deb");
    Installer installer(desktop, {"linux", "amd64"});

    auto result = installer.install(path);
    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.outcome, InstallOutcome::LinuxDeb);
    ASSERT_EQ(desktop.revealed.size(), 1u);
    EXPECT_EQ(desktop.revealed[0], path);
    EXPECT_TRUE(desktop.opened.empty());
    EXPECT_TRUE(desktop.quit_requests.empty());
}

TEST_F(InstallerTest, LinuxAppImage) {
    std::string path = make_artifact("VidGrab-2.3.0-x86_64.AppImage");
    Installer installer(desktop, {"linux", "x86_64"});

    auto result = installer.install(path);
    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.outcome, InstallOutcome::LinuxAppImage);
    EXPECT_EQ(desktop.revealed.size(), 1u);
}

TEST_F(InstallerTest, EmptyPathFails) {
    Installer installer(desktop, {"windows", "amd64"});
    auto result = installer.install("");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error.message, "No update downloaded");
    EXPECT_TRUE(desktop.opened.empty());
}

TEST_F(InstallerTest, MissingFileFails) {
    Installer installer(desktop, {"windows", "amd64"});
    auto result = installer.install(test_dir + "/gone.exe");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error.kind, UpdateErrorKind::Io);
}

TEST_F(InstallerTest, DesktopFailureIsReported) {
    std::string path = make_artifact("VidGrab-Setup.exe");
    desktop.fail = true;
    Installer installer(desktop, {"windows", "amd64"});

    auto result = installer.install(path);
    EXPECT_FALSE(result.success);
    EXPECT_NE(result.error.message.find("no handler"), std::string::npos);
    EXPECT_TRUE(desktop.quit_requests.empty());
}

TEST_F(InstallerTest, UnsupportedPlatform) {
    std::string path = make_artifact("VidGrab.bin");
    Installer installer(desktop, {"freebsd", "amd64"});
    EXPECT_FALSE(installer.install(path).success);
}
