#include "covenant/cli.hpp"
#include "covenant/config.hpp"
#include "covenant/crypto.hpp"
#include "covenant/license_builder.hpp"
#include "covenant/license_validator.hpp"
#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>

namespace covenant::cli
{

	namespace
	{
		constexpr const char *kDefaultConfig = "covenant.toml";

		constexpr int kExitOk = 0;
		constexpr int kExitError = 1;
		constexpr int kExitRejected = 2;

		Result<std::string> read_file(const std::string &path)
		{
			std::ifstream file(path);
			if (!file.is_open())
			{
				return std::unexpected(CovenantError::io("Unable to open file: " + path));
			}
			std::stringstream buffer;
			buffer << file.rdbuf();
			return buffer.str();
		}

		Result<void> write_file(const std::filesystem::path &path, const std::string &content)
		{
			std::ofstream out(path);
			if (!out.is_open())
			{
				return std::unexpected(CovenantError::io("Unable to open output file: " + path.string()));
			}
			out << content;
			if (!out)
			{
				return std::unexpected(CovenantError::io("Failed writing " + path.string()));
			}
			return {};
		}

		Result<std::pair<std::string, std::string>> split_pair(const std::string &entry)
		{
			auto eq = entry.find('=');
			if (eq == std::string::npos || eq == 0)
			{
				return std::unexpected(CovenantError::invalid_input("Expected name=value, got '" + entry + "'"));
			}
			return std::make_pair(entry.substr(0, eq), entry.substr(eq + 1));
		}

		Result<AttributeMap> read_features_json(const std::string &path)
		{
			auto text = read_file(path);
			if (!text)
				return std::unexpected(text.error());

			auto j = nlohmann::json::parse(*text, nullptr, false);
			if (j.is_discarded() || !j.is_object())
			{
				return std::unexpected(CovenantError::invalid_input("Features file must hold a JSON object: " + path));
			}

			AttributeMap features;
			for (auto it = j.begin(); it != j.end(); ++it)
			{
				features[it.key()] = it.value().is_string() ? it.value().get<std::string>() : it.value().dump();
			}
			return features;
		}

		Result<CovenantConfig> load_config(const std::string &path)
		{
			if (!path.empty())
				return ConfigLoader::load(path);
			if (std::filesystem::exists(kDefaultConfig))
				return ConfigLoader::load(kDefaultConfig);
			return ConfigLoader::defaults();
		}

		int fail(const CovenantError &error)
		{
			spdlog::error("{}: {}", error_code_to_string(error.code), error.what());
			return kExitError;
		}

		Timestamp now()
		{
			return std::chrono::floor<std::chrono::seconds>(std::chrono::system_clock::now());
		}

		struct KeygenOptions
		{
			std::string out_dir{"keys"};
			std::string curve{"P-256"};
			std::string format{"pem"};
		};

		int run_keygen(const CovenantConfig &cfg, const KeygenOptions &opts)
		{
			auto pair = crypto::KeyGenerator::generate(opts.curve);
			if (!pair)
				return fail(pair.error());

			const auto passphrase = cfg.passphrase().value_or("");
			if (passphrase.empty())
			{
				spdlog::warn("{} is not set; private key will be written unencrypted", cfg.keys.passphrase_env);
			}

			const bool pem = opts.format == "pem";
			auto private_text = pem ? pair->private_key_pem(passphrase) : pair->to_encrypted_private_key_string(passphrase);
			if (!private_text)
				return fail(private_text.error());
			auto public_text = pem ? pair->public_key_pem() : pair->to_public_key_string();
			if (!public_text)
				return fail(public_text.error());

			std::error_code ec;
			std::filesystem::create_directories(opts.out_dir, ec);
			if (ec)
				return fail(CovenantError::io("Unable to create " + opts.out_dir + ": " + ec.message()));

			const std::filesystem::path dir(opts.out_dir);
			const auto private_path = dir / (pem ? "private.pem" : "private.key");
			const auto public_path = dir / (pem ? "public.pem" : "public.key");
			if (auto w = write_file(private_path, *private_text); !w)
				return fail(w.error());
			std::filesystem::permissions(private_path, std::filesystem::perms::owner_read | std::filesystem::perms::owner_write,
										 std::filesystem::perm_options::replace, ec);
			if (ec)
				spdlog::warn("Unable to restrict permissions on {}: {}", private_path.string(), ec.message());
			if (auto w = write_file(public_path, *public_text); !w)
				return fail(w.error());

			spdlog::info("Generated {} key pair in {}", opts.curve, opts.out_dir);
			std::cout << private_path.string() << "\n"
					  << public_path.string() << std::endl;
			return kExitOk;
		}

		struct IssueOptions
		{
			std::string out_path;
			std::string id{"random"};
			std::string type;
			uint32_t quantity{0};
			std::string expires;
			std::string customer_name;
			std::string customer_email;
			std::vector<std::string> features;
			std::vector<std::string> attributes;
			std::string features_json;
			std::vector<std::string> sublicenses;
			uint32_t version{0};
		};

		Result<LicenseBuilder> builder_from(const IssueOptions &opts)
		{
			LicenseBuilder builder;

			if (opts.id == "random")
			{
				builder.with_random_identifier();
			}
			else
			{
				auto id = Uuid::parse(opts.id);
				if (!id)
					return std::unexpected(id.error());
				builder.with_unique_identifier(*id);
			}

			if (!opts.type.empty())
			{
				auto kind = license_kind_from_string(opts.type);
				if (!kind)
					return std::unexpected(kind.error());
				builder.as(*kind);
			}

			if (!opts.expires.empty())
			{
				auto expires = parse_iso8601(opts.expires);
				if (!expires)
					return std::unexpected(expires.error());
				builder.expires_at(*expires);
			}

			if (!opts.customer_name.empty() || !opts.customer_email.empty())
				builder.licensed_to(opts.customer_name, opts.customer_email);

			if (!opts.features_json.empty())
			{
				auto features = read_features_json(opts.features_json);
				if (!features)
					return std::unexpected(features.error());
				builder.with_product_features(std::move(*features));
			}
			for (const auto &entry : opts.features)
			{
				auto kv = split_pair(entry);
				if (!kv)
					return std::unexpected(kv.error());
				builder.add_product_feature(kv->first, kv->second);
			}
			for (const auto &entry : opts.attributes)
			{
				auto kv = split_pair(entry);
				if (!kv)
					return std::unexpected(kv.error());
				builder.add_additional_attribute(kv->first, kv->second);
			}

			for (const auto &path : opts.sublicenses)
			{
				auto sub = LicenseValidator::load(path);
				if (!sub)
					return std::unexpected(sub.error());
				builder.add_sublicense(std::move(*sub));
			}

			builder.with_maximum_utilization(opts.quantity).with_version(opts.version);
			return builder;
		}

		int run_issue(const CovenantConfig &cfg, const IssueOptions &opts)
		{
			auto builder = builder_from(opts);
			if (!builder)
				return fail(builder.error());

			auto key = crypto::PrivateKey::load_file(cfg.keys.private_key, cfg.passphrase().value_or(""));
			if (!key)
				return fail(key.error());

			auto license = builder->create_and_sign(*key);
			if (!license)
				return fail(license.error());

			auto text = license->to_string(cfg.output.pretty);
			if (opts.out_path.empty())
			{
				std::cout << text << std::endl;
			}
			else
			{
				if (auto w = write_file(opts.out_path, text); !w)
					return fail(w.error());
				spdlog::info("Issued license {} to {}", license->id().to_string(), opts.out_path);
			}
			return kExitOk;
		}

		struct VerifyOptions
		{
			std::string file;
			std::string public_key;
			bool sublicenses{false};
		};

		int run_verify(const CovenantConfig &cfg, const VerifyOptions &opts)
		{
			auto license = LicenseValidator::load(opts.file);
			if (!license)
				return fail(license.error());

			const auto &key_path = opts.public_key.empty() ? cfg.keys.public_key : opts.public_key;
			auto key = crypto::PublicKey::load_file(key_path);
			if (!key)
				return fail(key.error());

			int status = kExitOk;
			auto valid = LicenseValidator::validate(*license, *key, now());
			if (!valid)
			{
				if (valid.error().code != ErrorCode::LicenseError)
					return fail(valid.error());
				std::cout << "INVALID " << license->id().to_string() << ": " << valid.error().what() << std::endl;
				status = kExitRejected;
			}
			else
			{
				std::cout << "VALID " << license->id().to_string() << std::endl;
			}

			if (opts.sublicenses)
			{
				auto results = LicenseValidator::validate_sublicenses(*license, *key);
				if (!results)
					return fail(results.error());
				for (size_t i = 0; i < results->size(); ++i)
				{
					const auto &sub = license->sublicenses()[i];
					std::cout << "  sublicense " << sub.id().to_string() << ": "
							  << ((*results)[i] ? "VALID" : "INVALID") << std::endl;
					if (!(*results)[i])
						status = kExitRejected;
				}
			}
			return status;
		}

		int run_inspect(const std::string &path)
		{
			auto license = LicenseValidator::load(path);
			if (!license)
				return fail(license.error());
			std::cout << license->to_json().dump(2) << std::endl;
			return kExitOk;
		}

	} // namespace

	int run(int argc, char *argv[])
	{
		CLI::App app{"Covenant signed license tool"};

		std::string config_path;
		app.add_option("--config", config_path, "Path to config TOML (defaults to ./covenant.toml when present)");

		auto cfg_cmd = app.add_subcommand("config-print", "Load and print config as JSON");

		KeygenOptions keygen;
		auto keygen_cmd = app.add_subcommand("keygen", "Generate an EC signing key pair");
		keygen_cmd->add_option("--out-dir", keygen.out_dir, "Directory for the key files");
		keygen_cmd->add_option("--curve", keygen.curve, "Curve name (P-256, P-384, P-521)");
		keygen_cmd->add_option("--format", keygen.format, "Key file format")->check(CLI::IsMember({"pem", "string"}));

		IssueOptions issue;
		auto issue_cmd = app.add_subcommand("issue", "Build and sign a license");
		issue_cmd->add_option("--out", issue.out_path, "Output file path (defaults to stdout)");
		issue_cmd->add_option("--id", issue.id, "License id (UUID) or 'random'");
		issue_cmd->add_option("--type", issue.type, "Trial, Standard or Unrestricted");
		issue_cmd->add_option("--quantity", issue.quantity, "Maximum utilization");
		issue_cmd->add_option("--expires", issue.expires, "Expiration (ISO 8601)");
		issue_cmd->add_option("--customer-name", issue.customer_name, "Customer name");
		issue_cmd->add_option("--customer-email", issue.customer_email, "Customer email");
		issue_cmd->add_option("--feature", issue.features, "Product feature name=value");
		issue_cmd->add_option("--attribute", issue.attributes, "Additional attribute name=value");
		issue_cmd->add_option("--features-json", issue.features_json, "JSON object of product features");
		issue_cmd->add_option("--sublicense", issue.sublicenses, "Signed license file to embed");
		issue_cmd->add_option("--version", issue.version, "Document version attribute");

		VerifyOptions verify;
		auto verify_cmd = app.add_subcommand("verify", "Verify a license signature and expiry");
		verify_cmd->add_option("--file", verify.file, "License file")->required();
		verify_cmd->add_option("--public-key", verify.public_key, "Public key file (overrides config)");
		verify_cmd->add_flag("--sublicenses", verify.sublicenses, "Also verify each embedded sub-license");

		std::string inspect_path;
		auto inspect_cmd = app.add_subcommand("inspect", "Print a license as JSON");
		inspect_cmd->add_option("--file", inspect_path, "License file")->required();

		CLI11_PARSE(app, argc, argv);

		auto cfg = load_config(config_path);
		if (!cfg)
			return fail(cfg.error());
		spdlog::set_level(spdlog::level::from_str(cfg->logging.level));

		if (*cfg_cmd)
		{
			std::cout << ConfigLoader::to_json(*cfg).dump(2) << std::endl;
			return kExitOk;
		}
		if (*keygen_cmd)
			return run_keygen(*cfg, keygen);
		if (*issue_cmd)
			return run_issue(*cfg, issue);
		if (*verify_cmd)
			return run_verify(*cfg, verify);
		if (*inspect_cmd)
			return run_inspect(inspect_path);

		std::cout << app.help() << std::endl;
		return kExitOk;
	}

} // namespace covenant::cli
