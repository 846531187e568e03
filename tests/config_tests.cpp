#include "test.hpp"

#include "../src/options.hpp"
#include "../src/simple_config.hpp"

#include <filesystem>
#include <fstream>

using namespace batch_newton;

void test_parse_options() {
  const SimpleConfig cfg = SimpleConfig::parse("# newton run\n"
                                               "name: \"bowls\"\n"
                                               "reg0: 1e-5\n"
                                               "max_it: 25\n"
                                               "ls_pts_nb: 7\n"
                                               "force_step: yes\n"
                                               "batched: true\n"
                                               "  full_output : on  \n"
                                               "tolerance: 1e-12\n"
                                               "convergence: per_row\n"
                                               "regularization: cholesky\n"
                                               "reg_growth: 10\n"
                                               "reg_max: 1e9\n"
                                               "verbose: 1\n"
                                               "verbose_prefix: '>> '\n"
                                               "log_interval: 5\n");
  const NewtonOptions o = NewtonOptions::fromConfig(cfg);

  Tests::expect(o.name == "bowls", "quoted string value");
  Tests::expectNear(o.reg0, 1e-5, 0.0, "reg0");
  Tests::expect(o.max_it == 25, "max_it");
  Tests::expect(o.ls_pts_nb == 7, "ls_pts_nb");
  Tests::expect(o.force_step && o.batched && o.full_output && o.verbose, "boolean spellings");
  Tests::expectNear(o.tolerance, 1e-12, 0.0, "tolerance");
  Tests::expect(o.convergence == ConvergenceMode::PerRow, "convergence mode");
  Tests::expect(o.regularization == RegularizationStrategy::CholeskyOnly, "regularization strategy");
  Tests::expectNear(o.reg_growth, 10.0, 0.0, "reg_growth");
  Tests::expectNear(o.reg_max, 1e9, 0.0, "reg_max");
  Tests::expect(o.verbose_prefix == ">> ", "prefix keeps inner spaces");
  Tests::expect(o.log_interval == 5, "log_interval");
}

void test_defaults_survive_bad_values() {
  const SimpleConfig cfg = SimpleConfig::parse("max_it: many\n"
                                               "reg0: tiny\n"
                                               "batched: maybe\n"
                                               "convergence: sometimes\n"
                                               "no separator on this line\n");
  const NewtonOptions o = NewtonOptions::fromConfig(cfg);
  const NewtonOptions defaults;

  Tests::expect(o.max_it == defaults.max_it, "malformed integer keeps default");
  Tests::expectNear(o.reg0, defaults.reg0, 0.0, "malformed real keeps default");
  Tests::expect(o.batched == defaults.batched, "malformed boolean keeps default");
  Tests::expect(o.convergence == ConvergenceMode::BatchMean, "unknown mode keeps default");
  Tests::expect(!cfg.has("no separator on this line"), "lines without ':' are skipped");
}

void test_validate() {
  NewtonOptions o;
  o.validate();

  o.reg0 = -1.0;
  Tests::expectThrows<InputError>([&]() { o.validate(); }, "negative reg0");
  o = NewtonOptions();
  o.reg_growth = 1.0;
  Tests::expectThrows<InputError>([&]() { o.validate(); }, "growth must exceed 1");
  o = NewtonOptions();
  o.reg_max = o.reg0;
  Tests::expectThrows<InputError>([&]() { o.validate(); }, "reg_max must exceed reg0");
  o = NewtonOptions();
  o.ls_pts_nb = 0;
  Tests::expectThrows<InputError>([&]() { o.validate(); }, "line search needs a point");
  o = NewtonOptions();
  o.max_it = -3;
  Tests::expectThrows<InputError>([&]() { o.validate(); }, "negative iteration limit");
}

void test_load_file() {
  const std::filesystem::path path = std::filesystem::temp_directory_path() / "batch_newton_config_test.cfg";
  {
    std::ofstream out(path);
    out << "max_it: 3\n# comment: ignored\n";
  }
  const SimpleConfig cfg = SimpleConfig::load(path.string());
  Tests::expect(cfg.loaded(), "file loaded");
  Tests::expect(cfg.getInt("max_it", 0) == 3, "value read from file");
  Tests::expect(!cfg.has("# comment"), "comments skipped");
  std::filesystem::remove(path);

  const SimpleConfig missing = SimpleConfig::load(path.string());
  Tests::expect(!missing.loaded(), "missing file reports not loaded");
  Tests::expect(NewtonOptions::fromConfig(missing).max_it == NewtonOptions().max_it, "missing file keeps defaults");
}

int main() {
  auto suite = Tests::TestSuite();

  suite.addCheck("parse options", test_parse_options);
  suite.addCheck("defaults survive malformed values", test_defaults_survive_bad_values);
  suite.addCheck("validate options", test_validate);
  suite.addCheck("load config file", test_load_file);

  return suite.runTests() == 0 ? 0 : 1;
}
