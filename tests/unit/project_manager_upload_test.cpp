#include "internal/core/project_manager.hpp"

#include <algorithm>
#include <atomic>
#include <cassert>
#include <condition_variable>
#include <mutex>
#include <iostream>
#include <memory>
#include <thread>
#include <vector>

#include "internal/access/access_gate.hpp"
#include "internal/flow/directory_flow_loader.hpp"
#include "internal/util/errors.hpp"
#include "test_dirs.hpp"

namespace {

namespace fs = std::filesystem;

using flowstore::access::User;
using flowstore::core::ProjectManager;
using flowstore::core::ProjectManagerOptions;
using flowstore::testing::TempDir;
using flowstore::testing::WriteJob;

const User kAlice{"alice"};

/*
  Directory loader that parks inside Load() for directories named
  "gated*" until Release(), so other operations can be lined up behind
  an upload that is still running.
*/
class GatedFlowLoader final : public flowstore::flow::FlowLoader {
 public:
  flowstore::flow::FlowLoadResult Load(const fs::path& directory) const override {
    if (directory.filename().string().rfind("gated", 0) == 0) {
      std::unique_lock lock(mutex_);
      entered_ = true;
      cv_.notify_all();
      cv_.wait(lock, [this] { return released_; });
    }
    return inner_.Load(directory);
  }

  void WaitUntilEntered() const {
    std::unique_lock lock(mutex_);
    cv_.wait(lock, [this] { return entered_; });
  }

  void Release() {
    std::lock_guard lock(mutex_);
    released_ = true;
    cv_.notify_all();
  }

 private:
  flowstore::flow::DirectoryFlowLoader inner_;

  mutable std::mutex              mutex_;
  mutable std::condition_variable cv_;
  mutable bool                    entered_{false};
  bool                            released_{false};
};

std::shared_ptr<ProjectManager> MakeManager(const fs::path& root) {
  ProjectManagerOptions options;
  options.root = root;
  return std::make_shared<ProjectManager>(options, std::make_shared<flowstore::flow::DirectoryFlowLoader>());
}

// One flow per name in `flows`, each a single job.
fs::path Stage(const fs::path& base, const std::string& name, const std::vector<std::string>& flows) {
  const auto staged = base / name;
  for (const auto& flow : flows) WriteJob(staged, flow);
  return staged;
}

std::vector<std::string> SortedIds(const flowstore::flow::FlowMap& flows) {
  auto ids = flows.Ids();
  std::sort(ids.begin(), ids.end());
  return ids;
}

// Flow ids as persisted in <root>/<name>/<version>/*.flow
std::vector<std::string> FlowIdsOnDisk(const fs::path& version_dir) {
  std::vector<std::string> ids;
  for (const auto& entry : fs::directory_iterator(version_dir)) {
    if (entry.path().extension() == ".flow") ids.push_back(entry.path().stem().string());
  }
  std::sort(ids.begin(), ids.end());
  return ids;
}

void TestRejectedUploadLeavesProjectUnchanged() {
  TempDir    dir("upload_reject");
  const auto root    = dir.path() / "store";
  auto       manager = MakeManager(root);
  manager->CreateProject("alpha", "a", kAlice);

  const auto good = manager->UploadProject("alpha", Stage(dir.path(), "good", {"daily"}), kAlice, false);

  const auto bad = dir.path() / "bad";
  WriteJob(bad, "broken", "ghost");

  bool rejected = false;
  try {
    manager->UploadProject("alpha", bad, kAlice, false);
  } catch (const flowstore::util::UploadRejected& e) {
    rejected = true;
    assert(e.Errors().size() == 1);
    assert(std::string(e.what()).find("Dependency ghost of job broken not found") != std::string::npos);
  }
  assert(rejected);

  const auto after = manager->GetProject("alpha", kAlice);
  assert(after.metadata.source() == good.metadata.source());
  assert(after.metadata.last_modified_time_ms() == good.metadata.last_modified_time_ms());
  assert((SortedIds(*after.flows) == std::vector<std::string>{"daily"}));

  // survives a restart too
  auto reloaded = MakeManager(root);
  assert(reloaded->GetProject("alpha", kAlice).metadata.source() == good.metadata.source());
}

void TestEmptyUploadIsRejected() {
  TempDir dir("upload_empty");
  auto    manager = MakeManager(dir.path() / "store");
  manager->CreateProject("alpha", "a", kAlice);

  const auto empty = dir.path() / "empty";
  fs::create_directories(empty);

  bool rejected = false;
  try {
    manager->UploadProject("alpha", empty, kAlice, false);
  } catch (const flowstore::util::UploadRejected& e) {
    rejected = true;
    assert(std::string(e.what()).find("No flows found") != std::string::npos);
  }
  assert(rejected);
  assert(manager->GetProject("alpha", kAlice).metadata.source().empty());
}

void TestSharedJobErrorReportedOnce() {
  TempDir dir("upload_shared_error");
  auto    manager = MakeManager(dir.path() / "store");
  manager->CreateProject("alpha", "a", kAlice);

  // "shared" has no type and sits in both flows
  const auto bad = dir.path() / "bad";
  flowstore::testing::WriteText(bad / "shared.job", "command=echo shared\n");
  WriteJob(bad, "one", "shared");
  WriteJob(bad, "two", "shared");

  bool rejected = false;
  try {
    manager->UploadProject("alpha", bad, kAlice, false);
  } catch (const flowstore::util::UploadRejected& e) {
    rejected = true;
    assert(e.Errors().size() == 1);
    assert(e.Errors()[0] == "Job shared has no type");
  }
  assert(rejected);
}

void TestForcedUploadCommitsWithErrors() {
  TempDir    dir("upload_force");
  const auto root    = dir.path() / "store";
  auto       manager = MakeManager(root);
  manager->CreateProject("alpha", "a", kAlice);

  const auto bad = dir.path() / "bad";
  WriteJob(bad, "broken", "ghost");

  const auto snapshot = manager->UploadProject("alpha", bad, kAlice, true);
  assert(!snapshot.metadata.source().empty());
  const auto flow = snapshot.flows->Find("broken");
  assert(flow);
  assert(flow->errors_size() == 1);
  assert(fs::is_regular_file(root / "alpha" / snapshot.metadata.source() / "broken.flow"));
}

void TestReadersNeverSeeMixedVersions() {
  TempDir    dir("upload_readers");
  const auto root    = dir.path() / "store";
  auto       manager = MakeManager(root);
  manager->CreateProject("alpha", "a", kAlice);
  manager->UploadProject("alpha", Stage(dir.path(), "initial", {"f0"}), kAlice, false);

  constexpr int     kUploads = 20;
  std::atomic<bool> done{false};
  std::atomic<int>  checks{0};

  std::vector<std::thread> readers;
  for (int r = 0; r < 4; ++r) {
    readers.emplace_back([&] {
      while (!done.load()) {
        const auto snapshot = manager->GetProject("alpha", kAlice);
        const auto version  = root / "alpha" / snapshot.metadata.source();
        assert(SortedIds(*snapshot.flows) == FlowIdsOnDisk(version));
        checks.fetch_add(1);
      }
    });
  }

  for (int i = 1; i <= kUploads; ++i) {
    // flow set differs per upload: f<i> and, every other time, shared
    std::vector<std::string> flows{"f" + std::to_string(i)};
    if (i % 2 == 0) flows.push_back("shared");
    manager->UploadProject("alpha", Stage(dir.path(), "up" + std::to_string(i), flows), kAlice, false);
  }

  done.store(true);
  for (auto& t : readers) t.join();

  assert(checks.load() > 0);
  const auto last = manager->GetProject("alpha", kAlice);
  assert((SortedIds(*last.flows) == std::vector<std::string>{"f20", "shared"}));
}

void TestParallelUploadsToDifferentProjects() {
  TempDir    dir("upload_parallel");
  const auto root    = dir.path() / "store";
  auto       manager = MakeManager(root);

  constexpr int kProjects = 6;
  for (int p = 0; p < kProjects; ++p) manager->CreateProject("p" + std::to_string(p), "d", kAlice);

  std::vector<std::thread> writers;
  for (int p = 0; p < kProjects; ++p) {
    writers.emplace_back([&, p] {
      const auto name = "p" + std::to_string(p);
      for (int i = 0; i < 3; ++i) {
        manager->UploadProject(name, Stage(dir.path(), name + "-" + std::to_string(i), {name + "flow" + std::to_string(i)}), kAlice, false);
      }
    });
  }
  for (auto& t : writers) t.join();

  auto reloaded = MakeManager(root);
  for (int p = 0; p < kProjects; ++p) {
    const auto name      = "p" + std::to_string(p);
    const auto live      = manager->GetProject(name, kAlice);
    const auto recovered = reloaded->GetProject(name, kAlice);
    assert((SortedIds(*live.flows) == std::vector<std::string>{name + "flow2"}));
    assert(recovered.metadata.source() == live.metadata.source());
    assert(SortedIds(*recovered.flows) == SortedIds(*live.flows));
  }
}

void TestConcurrentUploadsToOneProject() {
  TempDir    dir("upload_same_project");
  const auto root    = dir.path() / "store";
  auto       manager = MakeManager(root);
  manager->CreateProject("alpha", "a", kAlice);

  constexpr int            kWriters = 4;
  std::mutex               published_mutex;
  std::vector<std::string> published;
  std::vector<std::thread> writers;
  for (int w = 0; w < kWriters; ++w) {
    writers.emplace_back([&, w] {
      for (int i = 0; i < 3; ++i) {
        const auto tag      = "w" + std::to_string(w) + "i" + std::to_string(i);
        const auto snapshot = manager->UploadProject("alpha", Stage(dir.path(), tag, {tag}), kAlice, false);
        std::lock_guard lock(published_mutex);
        published.push_back(snapshot.metadata.source());
      }
    });
  }
  for (auto& t : writers) t.join();

  // each upload started from the previous one's published version
  std::sort(published.begin(), published.end());
  assert(std::adjacent_find(published.begin(), published.end()) == published.end());

  // every upload got its own version directory
  std::size_t versions = 0;
  for (const auto& entry : fs::directory_iterator(root / "alpha")) {
    if (entry.is_directory()) ++versions;
  }
  assert(versions == kWriters * 3);

  // the last upload to publish carries the newest version
  const auto live = manager->GetProject("alpha", kAlice);
  assert(live.metadata.source() == published.back());
  assert(live.flows->Size() == 1);
  assert(SortedIds(*live.flows) == FlowIdsOnDisk(root / "alpha" / live.metadata.source()));

  auto       reloaded  = MakeManager(root);
  const auto recovered = reloaded->GetProject("alpha", kAlice);
  assert(recovered.metadata.source() == live.metadata.source());
  assert(SortedIds(*recovered.flows) == SortedIds(*live.flows));
}

void TestRunningUploadBlocksPruneAndNextUpload() {
  TempDir    dir("upload_prune_race");
  const auto root   = dir.path() / "store";
  auto       loader = std::make_shared<GatedFlowLoader>();

  ProjectManagerOptions options;
  options.root = root;
  ProjectManager manager(options, loader);

  manager.CreateProject("alpha", "a", kAlice);
  const auto first = manager.UploadProject("alpha", Stage(dir.path(), "first", {"f0"}), kAlice, false).metadata.source();

  std::string              slow_version;
  std::string              fast_version;
  std::vector<std::string> pruned;
  std::vector<std::string> failures;
  std::mutex               failures_mutex;
  std::atomic<bool>        fast_done{false};
  std::atomic<bool>        prune_done{false};

  const auto record_failure = [&](const std::exception& e) {
    std::lock_guard lock(failures_mutex);
    failures.emplace_back(e.what());
  };

  std::thread slow([&] {
    try {
      slow_version = manager.UploadProject("alpha", Stage(dir.path(), "gated", {"slow"}), kAlice, false).metadata.source();
    } catch (const std::exception& e) {
      record_failure(e);
    }
  });
  loader->WaitUntilEntered();

  std::thread fast([&] {
    try {
      fast_version = manager.UploadProject("alpha", Stage(dir.path(), "fast", {"quick"}), kAlice, false).metadata.source();
    } catch (const std::exception& e) {
      record_failure(e);
    }
    fast_done.store(true);
  });
  std::thread prune([&] {
    try {
      pruned = manager.PruneInstallVersions("alpha", kAlice, 0);
    } catch (const std::exception& e) {
      record_failure(e);
    }
    prune_done.store(true);
  });

  // both wait for the running upload
  std::this_thread::sleep_for(std::chrono::milliseconds(100));
  assert(!fast_done.load());
  assert(!prune_done.load());
  assert(manager.GetProject("alpha", kAlice).metadata.source() == first);

  loader->Release();
  slow.join();
  fast.join();
  prune.join();

  assert(failures.empty());
  assert(!slow_version.empty());
  assert(slow_version > first);
  assert(fast_version > slow_version);

  // only versions older than the one current at prune time were removed
  assert(std::find(pruned.begin(), pruned.end(), first) != pruned.end());
  assert(std::find(pruned.begin(), pruned.end(), fast_version) == pruned.end());
  assert(!fs::exists(root / "alpha" / first));

  const auto live = manager.GetProject("alpha", kAlice);
  assert(live.metadata.source() == fast_version);
  assert((SortedIds(*live.flows) == std::vector<std::string>{"quick"}));
  assert(fs::is_directory(root / "alpha" / fast_version / "src"));
  assert(SortedIds(*live.flows) == FlowIdsOnDisk(root / "alpha" / fast_version));
}

} // namespace

int main() {
  TestRejectedUploadLeavesProjectUnchanged();
  TestEmptyUploadIsRejected();
  TestSharedJobErrorReportedOnce();
  TestForcedUploadCommitsWithErrors();
  TestReadersNeverSeeMixedVersions();
  TestParallelUploadsToDifferentProjects();
  TestConcurrentUploadsToOneProject();
  TestRunningUploadBlocksPruneAndNextUpload();

  std::cout << "flowstore_unit_project_manager_upload: pass\n";
  return 0;
}
