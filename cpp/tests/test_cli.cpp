#include <catch2/catch_test_macros.hpp>
#include "covenant/cli.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace
{
    int run_cli(std::vector<std::string> args)
    {
        args.insert(args.begin(), "covenant");
        std::vector<char *> argv;
        for (auto &arg : args)
            argv.push_back(arg.data());
        argv.push_back(nullptr);
        return covenant::cli::run(static_cast<int>(args.size()), argv.data());
    }

    std::string read_text(const fs::path &path)
    {
        std::ifstream in(path);
        std::stringstream buffer;
        buffer << in.rdbuf();
        return buffer.str();
    }

    void write_text(const fs::path &path, const std::string &text)
    {
        std::ofstream out(path);
        out << text;
    }

    struct Workspace
    {
        fs::path dir;

        Workspace() : dir(fs::temp_directory_path() / "covenant_cli_test")
        {
            fs::remove_all(dir);
            fs::create_directories(dir);
            write_text(config(), "[keys]\n"
                                 "private_key = \"" + (dir / "private.pem").string() + "\"\n"
                                 "public_key = \"" + (dir / "public.pem").string() + "\"\n"
                                 "passphrase_env = \"COVENANT_CLI_TEST_PASSPHRASE\"\n"
                                 "[logging]\n"
                                 "level = \"off\"\n");
        }
        ~Workspace() { fs::remove_all(dir); }

        fs::path config() const { return dir / "covenant.toml"; }
    };
}

TEST_CASE("CLI verify exit codes", "[cli]")
{
    Workspace ws;
    const auto config = ws.config().string();
    const auto good = (ws.dir / "good.lic").string();
    const auto tampered = (ws.dir / "tampered.lic").string();
    const auto public_key = (ws.dir / "public.pem").string();

    REQUIRE(run_cli({"--config", config, "keygen", "--out-dir", ws.dir.string()}) == 0);
    REQUIRE(fs::exists(ws.dir / "private.pem"));
    REQUIRE(fs::exists(public_key));

    REQUIRE(run_cli({"--config", config, "issue", "--out", good, "--type", "Standard",
                     "--quantity", "5", "--expires", "2999-01-01", "--feature", "seats=5"}) == 0);

    auto text = read_text(good);
    auto pos = text.find("<Quantity>5</Quantity>");
    REQUIRE(pos != std::string::npos);
    text.replace(pos, 22, "<Quantity>9</Quantity>");
    write_text(tampered, text);

    CHECK(run_cli({"--config", config, "verify", "--file", good, "--public-key", public_key}) == 0);
    CHECK(run_cli({"--config", config, "verify", "--file", tampered, "--public-key", public_key}) == 2);
    CHECK(run_cli({"--config", config, "verify", "--file", (ws.dir / "missing.lic").string(),
                   "--public-key", public_key}) == 1);

    // Public key taken from the config file
    CHECK(run_cli({"--config", config, "verify", "--file", good}) == 0);
}

TEST_CASE("CLI rejects an expired license", "[cli]")
{
    Workspace ws;
    const auto config = ws.config().string();
    const auto expired = (ws.dir / "expired.lic").string();

    REQUIRE(run_cli({"--config", config, "keygen", "--out-dir", ws.dir.string()}) == 0);
    REQUIRE(run_cli({"--config", config, "issue", "--out", expired, "--expires", "2001-01-01T00:00:00Z"}) == 0);
    CHECK(run_cli({"--config", config, "verify", "--file", expired}) == 2);
}

TEST_CASE("CLI reports bad input as errors", "[cli]")
{
    Workspace ws;
    const auto config = ws.config().string();
    const auto out = (ws.dir / "out.lic").string();

    REQUIRE(run_cli({"--config", config, "keygen", "--out-dir", ws.dir.string()}) == 0);
    CHECK(run_cli({"--config", config, "issue", "--out", out, "--type", "Gold"}) == 1);
    CHECK(run_cli({"--config", config, "issue", "--out", out, "--feature", "novalue"}) == 1);
    CHECK(run_cli({"--config", config, "inspect", "--file", out}) == 1);
    CHECK(run_cli({"--config", (ws.dir / "nope.toml").string(), "config-print"}) == 1);
    CHECK(run_cli({"--config", config, "config-print"}) == 0);
}
