#include <cassert>
#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/core/batch_runner.hpp"
#include "internal/util/errors.hpp"
#include "support/fakes.hpp"

namespace {

using projmgr::core::BatchRunner;
using projmgr::core::Selection;
using projmgr::model::OpResult;
using projmgr::model::RunOptions;
using projmgr::store::ProjectStore;
using projmgr::testing::ScriptedPrompter;
using projmgr::testing::TempDir;

std::shared_ptr<ProjectStore> MakeStore(const TempDir& dir, const std::vector<std::string>& ids) {
  auto store = std::make_shared<ProjectStore>(dir.path());
  for (const auto& id : ids) {
    projmgr::model::ProjectRecord record;
    record.id   = id;
    record.type = projmgr::model::ProjectType::kScripts;
    record.path = "/srv/" + id;
    store->Create(record);
  }
  return store;
}

template <typename Error, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const Error&) {
    return true;
  }
  return false;
}

void TestResolveAllProjects() {
  TempDir            dir("batch_all");
  std::ostringstream out;
  auto               prompter = std::make_shared<ScriptedPrompter>();

  BatchRunner empty(MakeStore(dir, {}), prompter, out);
  assert(Throws<projmgr::util::NotFound>([&] { empty.Resolve("", true); }));

  TempDir     populated_dir("batch_all_populated");
  BatchRunner batch(MakeStore(populated_dir, {"gamma", "alpha", "beta"}), prompter, out);

  const auto selection = batch.Resolve("", true);
  assert(selection.all);
  assert(selection.multiple);
  assert((selection.ids == std::vector<std::string>{"alpha", "beta", "gamma"}));

  assert(Throws<projmgr::util::ValidationError>([&] { batch.Resolve("", false); }));
}

void TestResolveWildcardAndExact() {
  TempDir            dir("batch_wildcard");
  std::ostringstream out;
  BatchRunner        batch(MakeStore(dir, {"alpha", "alphabeta", "beta"}), std::make_shared<ScriptedPrompter>(), out);

  const auto both = batch.Resolve("alpha+", true);
  assert(!both.all);
  assert(both.multiple);
  assert((both.ids == std::vector<std::string>{"alpha", "alphabeta"}));

  assert(Throws<projmgr::util::AmbiguousSelection>([&] { batch.Resolve("alpha+", false); }));
  assert(Throws<projmgr::util::AmbiguousSelection>([&] { batch.Resolve("+beta", false); }));

  // A single match behaves like the literal name.
  const auto single = batch.Resolve("alphab+", false);
  assert(!single.multiple);
  assert((single.ids == std::vector<std::string>{"alphabeta"}));

  assert(Throws<projmgr::util::NotFound>([&] { batch.Resolve("zeta+", true); }));
  assert(Throws<projmgr::util::NotFound>([&] { batch.Resolve("zeta", true); }));

  const auto exact = batch.Resolve("beta", true);
  assert(!exact.multiple);
  assert((exact.ids == std::vector<std::string>{"beta"}));
}

void TestConfirmOnlyAsksForInteractiveBatches() {
  TempDir            dir("batch_confirm");
  std::ostringstream out;
  auto               prompter = std::make_shared<ScriptedPrompter>();
  BatchRunner        batch(MakeStore(dir, {"alpha", "beta"}), prompter, out);

  const auto all = batch.Resolve("", true);

  prompter->Confirms(false);
  assert(!batch.Confirm(all, "stop", RunOptions{}));
  assert(prompter->questions.size() == 1);
  assert(prompter->questions.back() == "Are you sure you want to stop ALL 2 projects?");

  RunOptions quiet;
  quiet.quiet = true;
  assert(batch.Confirm(all, "stop", quiet));

  RunOptions force;
  force.force = true;
  assert(batch.Confirm(all, "stop", force));

  // Listing and single targets never ask.
  assert(batch.Confirm(all, "", RunOptions{}));
  assert(batch.Confirm(batch.Resolve("alpha", true), "stop", RunOptions{}));
  assert(prompter->questions.size() == 1);

  prompter->Confirms(true);
  assert(batch.Confirm(batch.Resolve("+a", true), "restart", RunOptions{}));
  assert(prompter->questions.back() == "Are you sure you want to restart these 2 projects?");
}

void TestRunContinuesAfterFailures() {
  TempDir            dir("batch_run");
  std::ostringstream out;
  BatchRunner        batch(MakeStore(dir, {"alpha", "beta", "gamma", "delta"}), std::make_shared<ScriptedPrompter>(), out);

  std::vector<std::string> visited;
  std::vector<bool>        single_flags;
  const auto               report = batch.Run(batch.Resolve("", true), "start", [&](const std::string& id, bool single) {
    visited.push_back(id);
    single_flags.push_back(single);
    if (id == "beta") {
      return OpResult::Fatal("beta failed");
    }
    if (id == "delta") {
      throw projmgr::util::ExternalToolError("delta exploded", "output");
    }
    return OpResult::Ok();
  });

  assert((visited == std::vector<std::string>{"alpha", "beta", "delta", "gamma"}));
  assert((report.succeeded == std::vector<std::string>{"alpha", "gamma"}));
  assert((report.failed == std::vector<std::string>{"beta", "delta"}));
  assert(!report.Ok());
  for (const bool single : single_flags) {
    assert(!single);
  }

  const auto text = out.str();
  assert(text.find("###   START for project:  alpha   ###") != std::string::npos);
  assert(text.find("###   START for project:  gamma   ###") != std::string::npos);
  assert(text.find("###   START for project:  alpha") < text.find("###   START for project:  beta"));
}

void TestRecoverableCountsAsFailure() {
  TempDir            dir("batch_recoverable");
  std::ostringstream out;
  BatchRunner        batch(MakeStore(dir, {"alpha"}), std::make_shared<ScriptedPrompter>(), out);

  bool       seen_single = false;
  const auto report      = batch.Run(batch.Resolve("alpha", true), "", [&](const std::string&, bool single) {
    seen_single = single;
    return OpResult::Recoverable("still running");
  });
  assert(seen_single);
  assert(!report.Ok());
  assert(out.str().empty());
}

} // namespace

int main() {
  TestResolveAllProjects();
  TestResolveWildcardAndExact();
  TestConfirmOnlyAsksForInteractiveBatches();
  TestRunContinuesAfterFailures();
  TestRecoverableCountsAsFailure();

  std::cout << "projmgr_unit_batch_runner: pass\n";
  return 0;
}
