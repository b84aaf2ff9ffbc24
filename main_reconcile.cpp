#include "config/engine_config.hpp"
#include "database/statement_persistence.hpp"
#include "extraction/extraction_service.hpp"
#include "extraction/transaction_labeler.hpp"
#include "observability/logger.hpp"
#include "observability/metrics.hpp"
#include "reconcile/reconciliation_orchestrator.hpp"
#include "statement_store_impl.hpp"

#include <fstream>
#include <iomanip>
#include <iostream>
#include <iterator>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

using namespace statement_recon;

namespace {

void printUsage(const char* program) {
  std::cerr << "Usage: " << program << " [--config FILE] [--memory] [--metrics] <command>\n"
            << "\n"
            << "Commands:\n"
            << "  ingest DUMP FILE... [--issuer NAME] [--confirm]\n"
            << "      Reconcile FILEs using the extraction output recorded in DUMP.\n"
            << "      Warnings stop the import unless --confirm is given.\n"
            << "  list                     List stored statements\n"
            << "  delete ID                Delete a statement and its transactions\n"
            << "  transactions [PERIOD]    all, current_month, last_month, last_3_months, last_6_months\n"
            << "  issuers                  Issuer labels used before\n";
}

std::string readFile(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in.is_open()) {
    throw std::runtime_error("Could not open " + path);
  }
  return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

std::string baseName(const std::string& path) {
  auto slash = path.find_last_of('/');
  return slash == std::string::npos ? path : path.substr(slash + 1);
}

void printSession(const reconcile::ReconciliationSession& session) {
  std::cout << "Session " << session.correlation_id << ": " << reconcile::toString(session.state)
            << std::endl;

  if (!session.filenames.empty()) {
    std::cout << "  Files: " << joinList(session.filenames, ", ") << std::endl;
    std::cout << "  Transactions: " << session.pending.size() << std::endl;
  }
  if (session.suggested_issuer) {
    std::cout << "  Suggested issuer: " << *session.suggested_issuer << std::endl;
  }
  if (session.cutoff_day) {
    std::cout << "  Cutoff day: " << *session.cutoff_day << std::endl;
  }
  if (session.stale_rows_filtered > 0) {
    std::cout << "  Filtered " << session.stale_rows_filtered
              << " row(s) dated outside the recency window" << std::endl;
  }

  for (const auto& issue : session.issues) {
    std::cout << "  [" << reconcile::toString(issue.kind) << "] " << issue.message << std::endl;
  }

  if (session.committed) {
    std::cout << "  Saved as statement #" << session.committed->id << " for "
              << session.committed->period << " (" << session.committed->tx_count
              << " transactions)" << std::endl;
  }
}

int runIngest(StatementStore& store, const config::EngineConfig& config,
              const std::vector<std::string>& args) {
  std::string issuer;
  bool confirm = false;
  std::vector<std::string> positional;

  for (size_t i = 0; i < args.size(); ++i) {
    if (args[i] == "--issuer" && i + 1 < args.size()) {
      issuer = args[++i];
    } else if (args[i] == "--confirm") {
      confirm = true;
    } else {
      positional.push_back(args[i]);
    }
  }

  if (positional.size() < 2) {
    std::cerr << "ingest needs an extraction dump and at least one file" << std::endl;
    return 2;
  }

  nlohmann::json dump;
  try {
    dump = nlohmann::json::parse(readFile(positional[0]));
  } catch (const nlohmann::json::exception& e) {
    std::cerr << "Invalid extraction dump " << positional[0] << ": " << e.what() << std::endl;
    return 1;
  }

  extraction::RecordedExtractionService extractor(dump);
  std::unique_ptr<extraction::RecordedLabeler> labeler;
  if (dump.contains("labels")) {
    labeler = std::make_unique<extraction::RecordedLabeler>(dump["labels"]);
  }

  std::vector<extraction::UploadedFile> files;
  for (size_t i = 1; i < positional.size(); ++i) {
    files.push_back({baseName(positional[i]), readFile(positional[i])});
  }

  reconcile::ReconciliationOrchestrator orchestrator(store, extractor, labeler.get(),
                                                     config.reconciliation);

  auto session = orchestrator.ingest(files, issuer);
  if (session.state == reconcile::SessionState::CHECKING_FUZZY) {
    session = orchestrator.reconcile(std::move(session));
  }

  if (session.state == reconcile::SessionState::AWAITING_CONFIRMATION) {
    if (confirm) {
      session = orchestrator.confirm(std::move(session));
    } else {
      printSession(session);
      session = orchestrator.cancel(std::move(session));
      std::cout << "Not imported; run again with --confirm to import anyway." << std::endl;
      return 3;
    }
  }

  printSession(session);

  switch (session.state) {
    case reconcile::SessionState::COMMITTED:
      return 0;
    case reconcile::SessionState::REJECTED_DUPLICATE:
      return 3;
    default:
      return session.hasIssue(reconcile::IssueKind::COMMIT_FAILURE) ? 1 : 0;
  }
}

int runList(StatementStore& store) {
  auto statements = store.listStatements();
  if (statements.empty()) {
    std::cout << "No statements stored." << std::endl;
    return 0;
  }

  for (const auto& s : statements) {
    std::cout << std::setw(6) << s.id << "  " << s.period << "  "
              << std::left << std::setw(24) << (s.issuer.empty() ? "-" : s.issuer) << std::right
              << std::setw(5) << s.tx_count << " tx  cutoff "
              << (s.cutoff_day ? std::to_string(*s.cutoff_day) : "-") << "  "
              << s.imported_at << "  " << joinList(s.filenames, ", ") << std::endl;
  }
  std::cout << store.statementCount() << " statement(s), " << store.transactionCount()
            << " transaction(s)" << std::endl;
  return 0;
}

int runTransactions(StatementStore& store, const std::vector<std::string>& args) {
  PeriodFilter filter = PeriodFilter::ALL;
  if (!args.empty()) {
    auto parsed = parsePeriodFilter(args[0]);
    if (!parsed) {
      std::cerr << "Unknown period filter: " << args[0] << std::endl;
      return 2;
    }
    filter = *parsed;
  }

  double total = 0.0;
  auto rows = store.listTransactions(filter);
  for (const auto& row : rows) {
    const auto& tx = row.transaction;
    std::cout << tx.trans_date << "  " << std::fixed << std::setprecision(2) << std::setw(12)
              << tx.amount << "  " << std::left << std::setw(20) << tx.category << std::right
              << "  " << tx.description << std::endl;
    if (tx.amount > 0) total += tx.amount;
  }
  std::cout << rows.size() << " transaction(s), expenses " << std::fixed << std::setprecision(2)
            << total << std::endl;
  return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
  std::string config_path = "config.json";
  bool in_memory = false;
  bool print_metrics = false;
  std::vector<std::string> args;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else if (arg == "--memory") {
      in_memory = true;
    } else if (arg == "--metrics") {
      print_metrics = true;
    } else if (arg == "--help" || arg == "-h") {
      printUsage(argv[0]);
      return 0;
    } else {
      args.push_back(arg);
    }
  }

  if (args.empty()) {
    printUsage(argv[0]);
    return 2;
  }

  config::EngineConfig config = config::ConfigLoader::load(config_path);
  observability::Logger::getInstance().setLogLevel(config.log_level);
  observability::Logger::getInstance().setOutputStream(std::cerr);

  int rc = 0;
  try {
    std::unique_ptr<StatementStore> store;
    std::shared_ptr<database::PostgresConnection> connection;

    if (in_memory) {
      store = std::make_unique<InMemoryStatementStore>();
    } else {
      connection = std::make_shared<database::PostgresConnection>(config.database);
      if (!connection->connect()) {
        std::cerr << "Failed to connect to " << connection->getConnectionInfo() << std::endl;
        return 1;
      }
      auto pg_store = std::make_unique<database::PostgresStatementStore>(connection);
      if (!pg_store->initializeSchema(config.schema_path)) {
        std::cerr << "Failed to initialize schema from " << config.schema_path << std::endl;
        return 1;
      }
      store = std::move(pg_store);
    }

    const std::string& command = args[0];
    std::vector<std::string> rest(args.begin() + 1, args.end());

    if (command == "ingest") {
      rc = runIngest(*store, config, rest);
    } else if (command == "list") {
      rc = runList(*store);
    } else if (command == "delete" && rest.size() == 1) {
      int64_t id = std::stoll(rest[0]);
      if (store->deleteStatement(id)) {
        std::cout << "Deleted statement #" << id << std::endl;
      } else {
        std::cout << "No statement #" << id << std::endl;
        rc = 1;
      }
    } else if (command == "transactions") {
      rc = runTransactions(*store, rest);
    } else if (command == "issuers") {
      for (const auto& issuer : store->previousIssuers()) {
        std::cout << issuer << std::endl;
      }
    } else {
      printUsage(argv[0]);
      rc = 2;
    }
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << std::endl;
    rc = 1;
  }

  if (print_metrics) {
    std::cout << observability::getGlobalMetrics().exportMetrics();
  }
  return rc;
}
