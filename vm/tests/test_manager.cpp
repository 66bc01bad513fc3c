#include <filesystem>

#include <gtest/gtest.h>

#include "fake_backend.hpp"
#include "manager.hpp"
#include "string_util.hpp"

namespace fs = std::filesystem;

class HvctlManagerTest : public ::testing::Test {
protected:
  void SetUp() override {
    drive = fs::temp_directory_path() /
            ("hvctl-test-" + hvctl::utils::random_hex(8));
    fs::create_directories(drive);
    backend = hvctl::create<fake_backend_t>();
    manager = hvctl::create<hvctl::manager_t>(
        hvctl::create<hvctl::memory_catalog_t>(),
        hvctl::manager_options_t{.vm_drive = drive, .kernel_dir = drive});
    manager->register_backend(backend);
  }

  void TearDown() override {
    manager.reset();
    fs::remove_all(drive);
  }

  std::shared_ptr<hvctl::handle_t> prepare(const std::string &name) {
    auto op = manager->prepare("fake-1",
                               hvctl::prepare_args_t{.name = name});
    auto err = op->wait();
    EXPECT_FALSE(err.has_value()) << *err;
    return manager->find(name);
  }

  fs::path drive;

  std::shared_ptr<fake_backend_t> backend;

  std::shared_ptr<hvctl::manager_t> manager;
};

TEST_F(HvctlManagerTest, BackendRegistry) {
  ASSERT_EQ(manager->find_backend("fake"), backend);
  ASSERT_EQ(manager->find_backend("vmware"), nullptr);
  ASSERT_EQ(manager->backends().size(), 1u);
  ASSERT_EQ(manager->installed_backends().size(), 1u);

  backend->available = false;
  ASSERT_TRUE(manager->installed_backends().empty());

  ASSERT_THROW(manager->register_backend(hvctl::create<fake_backend_t>()),
               hvctl::exception_t<hvctl::exists_error>);
}

TEST_F(HvctlManagerTest, BuiltinBackendsAreRegistered) {
  hvctl::register_builtin_backends(*manager);
  ASSERT_NE(manager->find_backend("firecracker"), nullptr);
  ASSERT_NE(manager->find_backend("qemu"), nullptr);
  ASSERT_EQ(manager->backends().size(), 3u);
}

TEST_F(HvctlManagerTest, CreateVirtualizerValidates) {
  try {
    manager->create_virtualizer("v", "vmware", "{}");
    FAIL() << "expected value_error";
  } catch (const hvctl::exception_t<hvctl::value_error> &e) {
    ASSERT_EQ(e.reason(), "unrecognized virtualizer type: vmware");
  }

  ASSERT_THROW(manager->create_virtualizer("v", "fake", "[1, 2]"),
               hvctl::exception_t<hvctl::value_error>);
  ASSERT_TRUE(manager->list().empty());

  manager->create_virtualizer("fake-1", "fake", "{}");
  try {
    manager->create_virtualizer("fake-1", "fake", "{\"x\":1}");
    FAIL() << "expected exists_error";
  } catch (const hvctl::exception_t<hvctl::exists_error> &e) {
    ASSERT_EQ(e.reason(), "virtualizer named 'fake-1' already exists");
  }
  ASSERT_EQ(manager->return_data("fake-1"), "{}");
}

TEST_F(HvctlManagerTest, CatalogQueries) {
  manager->create_virtualizer("b", "fake", "{}");
  manager->create_virtualizer("a", "fake", R"({"k":"v"})");

  auto entries = manager->list();
  ASSERT_EQ(entries.size(), 2u);
  ASSERT_EQ(entries[0].name, "a");
  ASSERT_EQ(entries[1].name, "b");

  ASSERT_EQ(manager->disk_format("a"), hvctl::disk_format_t::vmdk);
  ASSERT_EQ(manager->disk_alignment("a"), 4096u);
  ASSERT_NO_THROW(manager->validate_args("a"));
  ASSERT_EQ(manager->return_data("a"), R"({"k":"v"})");

  manager->delete_virtualizer("a");
  ASSERT_EQ(manager->list().size(), 1u);
}

TEST_F(HvctlManagerTest, MissingVirtualizer) {
  auto expect_missing = [](auto fn) {
    try {
      fn();
      FAIL() << "expected not_found_error";
    } catch (const hvctl::exception_t<hvctl::not_found_error> &e) {
      ASSERT_EQ(e.reason(), "no virtualizer named 'ghost'");
    }
  };
  expect_missing([&] { manager->delete_virtualizer("ghost"); });
  expect_missing([&] { manager->disk_format("ghost"); });
  expect_missing([&] { manager->disk_alignment("ghost"); });
  expect_missing([&] { manager->validate_args("ghost"); });
  expect_missing([&] { manager->return_data("ghost"); });
  expect_missing([&] {
    manager->prepare("ghost", hvctl::prepare_args_t{.name = "vm1"});
  });
}

TEST_F(HvctlManagerTest, EntryOfUnregisteredType) {
  auto catalog = hvctl::create<hvctl::memory_catalog_t>();
  catalog->insert({.name = "old", .type = "virtualbox", .data = "{}"});
  auto other = hvctl::create<hvctl::manager_t>(
      catalog, hvctl::manager_options_t{.vm_drive = drive, .kernel_dir = drive});
  try {
    other->disk_format("old");
    FAIL() << "expected value_error";
  } catch (const hvctl::exception_t<hvctl::value_error> &e) {
    ASSERT_EQ(e.reason(),
              "virtualizer 'old' has unrecognized virtualizer type: virtualbox");
  }
}

TEST_F(HvctlManagerTest, PrepareStartStopClose) {
  manager->create_virtualizer("fake-1", "fake", "{}");

  auto handle = prepare("vm1");
  ASSERT_NE(handle, nullptr);
  ASSERT_EQ(handle->virtualizer(), "fake-1");
  ASSERT_EQ(handle->folder().parent_path(), drive);
  ASSERT_EQ(handle->state(), hvctl::vm_state_t::ready);

  handle->start();
  ASSERT_TRUE(eventually(
      [&] { return handle->state() == hvctl::vm_state_t::alive; }));
  handle->stop();
  ASSERT_EQ(handle->state(), hvctl::vm_state_t::ready);
  handle->close(false);
  ASSERT_EQ(handle->state(), hvctl::vm_state_t::deleted);
  ASSERT_EQ(manager->find("vm1"), nullptr);
  ASSERT_TRUE(manager->active().empty());
}

TEST_F(HvctlManagerTest, SecondPrepareWithSameNameFails) {
  manager->create_virtualizer("fake-1", "fake", "{}");
  prepare("vm1");

  try {
    manager->prepare("fake-1", hvctl::prepare_args_t{.name = "vm1"});
    FAIL() << "expected exists_error";
  } catch (const hvctl::exception_t<hvctl::exists_error> &e) {
    ASSERT_EQ(e.reason(), "virtual machine already exists");
  }
  ASSERT_EQ(manager->active().size(), 1u);
}

TEST_F(HvctlManagerTest, InitializeFailureIsWrapped) {
  manager->create_virtualizer("fake-1", "fake", "broken");
  try {
    manager->prepare("fake-1", hvctl::prepare_args_t{.name = "vm1"});
    FAIL() << "expected value_error";
  } catch (const hvctl::exception_t<hvctl::value_error> &e) {
    ASSERT_EQ(e.reason(), "failed to initialize virtualizer 'fake-1': "
                          "cannot parse configuration");
  }
  ASSERT_TRUE(manager->active().empty());
}

TEST_F(HvctlManagerTest, CloseContinuesPastFailures) {
  manager->create_virtualizer("fake-1", "fake", "{}");
  auto stubborn = prepare("stubborn");
  auto stubborn_driver = backend->last_driver();
  auto polite = prepare("polite");
  auto idle = prepare("idle");

  stubborn->start();
  polite->start();
  ASSERT_TRUE(eventually([&] {
    return stubborn->state() == hvctl::vm_state_t::alive &&
           polite->state() == hvctl::vm_state_t::alive;
  }));
  stubborn_driver->ignore_kill = true;

  ASSERT_EQ(manager->close(), 1u);
  ASSERT_TRUE(manager->active().empty());
  ASSERT_EQ(stubborn->state(), hvctl::vm_state_t::deleted);
  ASSERT_EQ(polite->state(), hvctl::vm_state_t::deleted);
  ASSERT_EQ(idle->state(), hvctl::vm_state_t::deleted);
}

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
