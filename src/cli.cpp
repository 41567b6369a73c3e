#include "cosign/cli.hpp"
#include "cosign/config.hpp"
#include "cosign/events.hpp"
#include "cosign/ledger.hpp"
#include "cosign/ledger_store.hpp"
#include "cosign/treasury.hpp"
#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <exception>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

namespace cosign::cli
{

	namespace
	{
		struct Session
		{
			std::unique_ptr<LedgerStore> store;
			std::shared_ptr<InMemoryTreasury> treasury;
			std::unique_ptr<AuthorizationLedger> ledger;
		};

		int report(const CosignError &error)
		{
			std::cerr << error_code_to_string(error.code) << ": " << error.what() << std::endl;
			return exit_code(error);
		}

		std::shared_ptr<EventSink> make_sink(const CosignConfig &cfg)
		{
			if (!cfg.events.enabled)
				return nullptr;
			return std::make_shared<EventJournal>();
		}

		Result<Session> open_ledger(const CosignConfig &cfg)
		{
			Session session;
			session.store = std::make_unique<RocksDbLedgerStore>(cfg.storage.rocksdb_path);

			auto state = session.store->load_state();
			if (!state)
				return std::unexpected(state.error());
			if (!*state)
				return std::unexpected(CosignError::invalid_state(
					"No ledger at " + cfg.storage.rocksdb_path + "; run init first"));

			auto balance = session.store->load_balance();
			if (!balance)
				return std::unexpected(balance.error());
			session.treasury = std::make_shared<InMemoryTreasury>(balance->value_or(cfg.treasury.balance));

			auto ledger = AuthorizationLedger::restore(**state, session.treasury, make_sink(cfg));
			if (!ledger)
				return std::unexpected(ledger.error());
			session.ledger = std::move(*ledger);
			return session;
		}

		Result<void> persist(Session &session)
		{
			return session.store->save(session.ledger->snapshot(), session.treasury->balance());
		}

		nlohmann::json describe(const AuthorizationLedger &ledger, TxIndex index)
		{
			auto record = ledger.transaction(index);
			nlohmann::json j = record->to_json();
			j["index"] = index;
			j["confirmed_by"] = *ledger.confirmations(index);
			return j;
		}

		// Load the persisted ledger, apply one mutating operation and save.
		int mutate(const CosignConfig &cfg, const std::function<Result<nlohmann::json>(AuthorizationLedger &)> &op)
		{
			auto session = open_ledger(cfg);
			if (!session)
				return report(session.error());

			auto result = op(*session->ledger);
			if (!result)
				return report(result.error());

			if (auto saved = persist(*session); !saved)
				return report(saved.error());

			std::cout << result->dump(2) << std::endl;
			return 0;
		}
	} // namespace

	int exit_code(const CosignError &error)
	{
		switch (error.code)
		{
		case ErrorCode::NotOwner:
		case ErrorCode::TxNotFound:
		case ErrorCode::AlreadyConfirmed:
		case ErrorCode::NotConfirmed:
		case ErrorCode::AlreadyExecuted:
		case ErrorCode::InsufficientConfirmations:
		case ErrorCode::InvalidOwnerCount:
		case ErrorCode::DuplicateOwner:
			return 2;
		case ErrorCode::TransferFailed:
			return 3;
		default:
			return 1;
		}
	}

	int run(int argc, char *argv[])
	{
		CLI::App app{"cosign multi-owner transfer authorization"};
		app.require_subcommand(0, 1);

		std::string config_path;
		app.add_option("--config", config_path, "Path to config TOML");

		auto cfg_cmd = app.add_subcommand("config-print", "Load and print config as JSON");

		auto init_cmd = app.add_subcommand("init", "Create and persist a ledger from the configured owners");

		std::string caller;
		std::string destination;
		Amount amount{0};
		TxIndex tx_index{0};

		auto submit_cmd = app.add_subcommand("submit", "Propose a transfer");
		submit_cmd->add_option("--caller", caller, "Proposing owner")->required();
		submit_cmd->add_option("--to", destination, "Destination identity")->required();
		submit_cmd->add_option("--amount", amount, "Amount to transfer")->required();

		auto confirm_cmd = app.add_subcommand("confirm", "Confirm a transaction");
		confirm_cmd->add_option("--caller", caller, "Confirming owner")->required();
		confirm_cmd->add_option("--tx", tx_index, "Transaction index")->required();

		auto revoke_cmd = app.add_subcommand("revoke", "Withdraw a confirmation");
		revoke_cmd->add_option("--caller", caller, "Revoking owner")->required();
		revoke_cmd->add_option("--tx", tx_index, "Transaction index")->required();

		auto execute_cmd = app.add_subcommand("execute", "Execute a confirmed transaction");
		execute_cmd->add_option("--caller", caller, "Executing owner")->required();
		execute_cmd->add_option("--tx", tx_index, "Transaction index")->required();

		std::optional<TxIndex> show_index;
		auto show_cmd = app.add_subcommand("show", "Print the ledger or one transaction as JSON");
		show_cmd->add_option("--tx", show_index, "Transaction index");

		CLI11_PARSE(app, argc, argv);

		auto cfg = config_path.empty() ? ConfigLoader::from_env() : ConfigLoader::load(config_path);
		if (!cfg)
			return report(cfg.error());
		// Keep stdout for command output; logs and journal lines go to stderr.
		spdlog::set_default_logger(spdlog::stderr_color_mt("cosign"));
		spdlog::set_level(spdlog::level::from_str(cfg->log.level));

		try
		{
			if (*cfg_cmd)
			{
				std::cout << ConfigLoader::to_json(*cfg).dump(2) << std::endl;
				return 0;
			}

			if (*init_cmd)
			{
				RocksDbLedgerStore store(cfg->storage.rocksdb_path);
				auto existing = store.load_state();
				if (!existing)
					return report(existing.error());
				if (*existing)
					return report(CosignError::invalid_state(
						"A ledger already exists at " + cfg->storage.rocksdb_path));

				auto treasury = std::make_shared<InMemoryTreasury>(cfg->treasury.balance);
				auto ledger = AuthorizationLedger::create(cfg->ledger.owners, treasury);
				if (!ledger)
					return report(ledger.error());

				if (auto res = store.save((*ledger)->snapshot(), treasury->balance()); !res)
					return report(res.error());

				std::cout << nlohmann::json{{"owners", (*ledger)->owners()},
											{"threshold", (*ledger)->threshold()},
											{"balance", treasury->balance()}}
								 .dump(2)
						  << std::endl;
				return 0;
			}

			if (*submit_cmd)
			{
				return mutate(*cfg, [&](AuthorizationLedger &ledger) -> Result<nlohmann::json> {
					auto index = ledger.submit(caller, destination, amount);
					if (!index)
						return std::unexpected(index.error());
					return describe(ledger, *index);
				});
			}

			if (*confirm_cmd)
			{
				return mutate(*cfg, [&](AuthorizationLedger &ledger) -> Result<nlohmann::json> {
					if (auto res = ledger.confirm(caller, tx_index); !res)
						return std::unexpected(res.error());
					return describe(ledger, tx_index);
				});
			}

			if (*revoke_cmd)
			{
				return mutate(*cfg, [&](AuthorizationLedger &ledger) -> Result<nlohmann::json> {
					if (auto res = ledger.revoke(caller, tx_index); !res)
						return std::unexpected(res.error());
					return describe(ledger, tx_index);
				});
			}

			if (*execute_cmd)
			{
				return mutate(*cfg, [&](AuthorizationLedger &ledger) -> Result<nlohmann::json> {
					if (auto res = ledger.execute(caller, tx_index); !res)
						return std::unexpected(res.error());
					return describe(ledger, tx_index);
				});
			}

			if (*show_cmd)
			{
				auto session = open_ledger(*cfg);
				if (!session)
					return report(session.error());
				const auto &ledger = *session->ledger;

				if (show_index)
				{
					if (auto record = ledger.transaction(*show_index); !record)
						return report(record.error());
					std::cout << describe(ledger, *show_index).dump(2) << std::endl;
					return 0;
				}

				nlohmann::json txs = nlohmann::json::array();
				for (TxIndex i = 0; i < ledger.transaction_count(); ++i)
					txs.push_back(describe(ledger, i));

				std::cout << nlohmann::json{{"owners", ledger.owners()},
											{"threshold", ledger.threshold()},
											{"balance", session->treasury->balance()},
											{"transactions", std::move(txs)}}
								 .dump(2)
						  << std::endl;
				return 0;
			}
		}
		catch (const std::runtime_error &e)
		{
			std::cerr << e.what() << std::endl;
			return 1;
		}

		std::cout << app.help() << std::endl;
		return 0;
	}

} // namespace cosign::cli
