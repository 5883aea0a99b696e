#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/match/match_policy.hpp"

namespace {

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "recon_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

bool Rejects(const std::filesystem::path& path) {
  try {
    (void)recon::config::ConfigLoader::LoadFromYaml(path.string());
  } catch (const std::runtime_error&) {
    return true;
  }
  return false;
}

void TestScalarEscapingForQuotedAndBackslashValues() {
  const auto yaml_path = WriteYaml("quoted_backslash",
                                   R"(database:
  sqlite:
    path: "C:\\recon\\\"quoted\"\\ledger.sqlite"
    wal_mode: true
)");

  auto config = recon::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().sqlite().path() == "C:\\recon\\\"quoted\"\\ledger.sqlite");
  assert(config.database().sqlite().wal_mode());
}

void TestQuotedNumericScalarsStayStrings() {
  const auto yaml_path = WriteYaml("quoted_numeric",
                                   R"(matching:
  counterparty_rules:
    - counterparty_type: legacy_import
      account_ids: ["3648117", "0228362"]
      tolerance:
        date_window_days: 30
        amount_tolerance_cents: 100
run:
  process_tag: "2024"
)");

  auto config = recon::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  const auto& rule = config.matching().counterparty_rules(0);
  assert(rule.account_ids(0) == "3648117");
  assert(rule.account_ids(1) == "0228362");
  assert(rule.tolerance().date_window_days() == 30);
  assert(config.run().process_tag() == "2024");
}

void TestMatchingSectionBuildsPolicy() {
  const auto yaml_path = WriteYaml("matching_policy",
                                   R"(matching:
  default_tolerance:
    date_window_days: 5
  counterparty_rules:
    - counterparty_type: e_transfer
      description_keywords: ["e-transfer"]
      tolerance:
        amount_tolerance_cents: 200
  scoring:
    acceptance_threshold: 60
  reversal_window_days: 2
  reversal_keywords: ["chargeback"]
)");

  auto config = recon::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  auto policy = recon::match::MatchPolicy::FromConfig(config.matching());

  assert(policy.default_tolerance.date_window_days == 5);
  assert(policy.default_tolerance.amount_tolerance_cents == 0);
  assert(policy.rules.size() == 1);
  assert(policy.rules[0].description_keywords[0] == "E-TRANSFER");
  // unset rule fields inherit the default tolerance
  assert(policy.rules[0].tolerance.date_window_days == 5);
  assert(policy.rules[0].tolerance.amount_tolerance_cents == 200);
  assert(policy.scoring.acceptance_threshold == 60.0);
  assert(policy.scoring.exact_amount_bonus == 50.0);
  assert(policy.reversal_window_days == 2);
  assert(policy.HasReversalKeyword("Visa chargeback 1234"));
  assert(!policy.HasReversalKeyword("NSF fee"));
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field",
                                   R"(database:
  memory: {}
unknown_field: 123
)");

  assert(Rejects(yaml_path) && "ConfigLoader must reject unknown fields.");
}

void TestInvalidRulesAreRejected() {
  const auto no_selector = WriteYaml("rule_without_selector",
                                     R"(matching:
  counterparty_rules:
    - counterparty_type: card
)");
  assert(Rejects(no_selector));

  const auto negative_weight = WriteYaml("negative_weight",
                                         R"(matching:
  scoring:
    minimum_margin: -1
)");
  assert(Rejects(negative_weight));

  const auto empty_path = WriteYaml("empty_sqlite_path",
                                    R"(database:
  sqlite:
    wal_mode: true
)");
  assert(Rejects(empty_path));
}

} // namespace

int main() {
  TestScalarEscapingForQuotedAndBackslashValues();
  TestQuotedNumericScalarsStayStrings();
  TestMatchingSectionBuildsPolicy();
  TestUnknownFieldsAreRejected();
  TestInvalidRulesAreRejected();

  std::cout << "recon_unit_config_loader: pass\n";
  return 0;
}
