// Repository: Toolshed
// Component: Navigation Contract Tests
// Purpose: NavigationStack, SearchFilter and SelectionSet invariants.
// Copyright (c) 2025 Toolshed

#include <gtest/gtest.h>

#include <memory>
#include <optional>
#include <random>
#include <stdexcept>
#include <string>
#include <vector>

#include "toolshed/navigation/NavigationStack.hpp"
#include "toolshed/navigation/SearchFilter.hpp"
#include "toolshed/navigation/SelectionSet.hpp"
#include "fixtures/SampleCatalog.h"

namespace toolshed::navigation::testing {
namespace {

using catalog::CatalogSnapshot;
using toolshed::tests::fixtures::MakeSampleCatalog;
using toolshed::tests::fixtures::NodeNamed;

class NavigationContractTests : public ::testing::Test {
 protected:
  void SetUp() override {
    snapshot_ = std::make_shared<const CatalogSnapshot>(MakeSampleCatalog());
    utilities_ = *snapshot_->FindCategory("Utilities");
  }

  catalog::NodeId Id(const std::string& name) const { return NodeNamed(*snapshot_, name); }

  std::vector<std::string> Names(const std::vector<catalog::NodeId>& ids) const {
    std::vector<std::string> names;
    for (auto id : ids) names.push_back(snapshot_->FindNode(id)->name);
    return names;
  }

  std::shared_ptr<const CatalogSnapshot> snapshot_;
  catalog::Category utilities_;
};

// =============================================================================
// NavigationStack
// =============================================================================

TEST_F(NavigationContractTests, StartsAtCategoryRoot) {
  NavigationStack nav(snapshot_, utilities_);

  EXPECT_TRUE(nav.AtRoot());
  EXPECT_EQ(nav.Depth(), 1u);
  EXPECT_EQ(nav.CurrentNode(), utilities_.root);
  EXPECT_EQ(nav.Breadcrumb(), (std::vector<std::string>{"Utilities"}));
  EXPECT_EQ(Names(nav.CurrentChildren()), (std::vector<std::string>{"System", "Update"}));
  EXPECT_EQ(nav.SelectedIndex(), std::optional<size_t>(0));
}

TEST_F(NavigationContractTests, RejectsCategoryRootMissingFromSnapshot) {
  catalog::Category bogus{"Bogus", static_cast<catalog::NodeId>(snapshot_->Nodes().size())};
  EXPECT_THROW(NavigationStack(snapshot_, bogus), std::invalid_argument);
}

TEST_F(NavigationContractTests, EnterDirectoryPushesFrameAndResetsSelection) {
  NavigationStack nav(snapshot_, utilities_);
  nav.SetSelectedIndex(1);

  ASSERT_TRUE(nav.Enter(Id("System")));

  EXPECT_EQ(nav.Depth(), 2u);
  EXPECT_FALSE(nav.AtRoot());
  EXPECT_EQ(nav.SelectedIndex(), std::optional<size_t>(0));
  EXPECT_EQ(nav.Breadcrumb(), (std::vector<std::string>{"Utilities", "System"}));
  EXPECT_EQ(Names(nav.CurrentChildren()), (std::vector<std::string>{"Disk Usage", "Services"}));
  EXPECT_EQ(nav.Frames().back().selected_index, std::optional<size_t>(1));
}

TEST_F(NavigationContractTests, EnterLeafOrUnknownIsNoOp) {
  NavigationStack nav(snapshot_, utilities_);
  nav.SetSelectedIndex(1);

  EXPECT_FALSE(nav.Enter(Id("Update")));
  EXPECT_FALSE(nav.Enter(static_cast<catalog::NodeId>(snapshot_->Nodes().size() + 10)));

  EXPECT_EQ(nav.Depth(), 1u);
  EXPECT_EQ(nav.SelectedIndex(), std::optional<size_t>(1));
}

TEST_F(NavigationContractTests, GoBackAtRootIsNoOp) {
  NavigationStack nav(snapshot_, utilities_);
  EXPECT_FALSE(nav.GoBack());
  EXPECT_FALSE(nav.GoBack());
  EXPECT_EQ(nav.Depth(), 1u);
}

TEST_F(NavigationContractTests, GoBackRestoresSelectionActiveBeforeEnter) {
  NavigationStack nav(snapshot_, utilities_);
  nav.SetSelectedIndex(1);
  ASSERT_TRUE(nav.Enter(Id("System")));
  nav.SetSelectedIndex(1);
  ASSERT_TRUE(nav.Enter(Id("Services")));
  EXPECT_EQ(nav.Depth(), 3u);
  EXPECT_EQ(nav.Breadcrumb(),
            (std::vector<std::string>{"Utilities", "System", "Services"}));

  ASSERT_TRUE(nav.GoBack());
  EXPECT_EQ(nav.SelectedIndex(), std::optional<size_t>(1));
  ASSERT_TRUE(nav.GoBack());
  EXPECT_EQ(nav.SelectedIndex(), std::optional<size_t>(1));
  EXPECT_TRUE(nav.AtRoot());
}

TEST_F(NavigationContractTests, RandomWalkNeverEmptiesStack) {
  NavigationStack nav(snapshot_, utilities_);
  std::mt19937 rng(1234);

  for (int step = 0; step < 500; ++step) {
    if (rng() % 2 == 0) {
      const auto& children = nav.CurrentChildren();
      if (!children.empty()) nav.Enter(children[rng() % children.size()]);
    } else {
      nav.GoBack();
    }
    ASSERT_GE(nav.Depth(), 1u);
    ASSERT_EQ(nav.Frames().front().node, utilities_.root);
    ASSERT_EQ(nav.Breadcrumb().size(), nav.Depth());
  }
}

// =============================================================================
// SearchFilter
// =============================================================================

TEST_F(NavigationContractTests, SearchMatchesNameCaseInsensitively) {
  NavigationStack nav(snapshot_, utilities_);
  auto visible = FilterChildren(*snapshot_, nav.CurrentChildren(), "upd");
  EXPECT_EQ(Names(visible), (std::vector<std::string>{"Update"}));

  visible = FilterChildren(*snapshot_, nav.CurrentChildren(), "SYS");
  EXPECT_EQ(Names(visible), (std::vector<std::string>{"System"}));
}

TEST_F(NavigationContractTests, SearchMatchesDescription) {
  NavigationStack nav(snapshot_, utilities_);
  // "Upgrade all packages" is Update's description.
  auto visible = FilterChildren(*snapshot_, nav.CurrentChildren(), "packages");
  EXPECT_EQ(Names(visible), (std::vector<std::string>{"Update"}));
}

TEST_F(NavigationContractTests, EmptyQueryIsIdentity) {
  NavigationStack nav(snapshot_, utilities_);
  EXPECT_EQ(FilterChildren(*snapshot_, nav.CurrentChildren(), ""), nav.CurrentChildren());
}

TEST_F(NavigationContractTests, FilterResultIsOrderedSubsetOfChildren) {
  NavigationStack nav(snapshot_, utilities_);
  ASSERT_TRUE(nav.Enter(Id("System")));
  const auto& children = nav.CurrentChildren();

  for (const std::string query : {"s", "e", "disk", "xyz", "SERV", " "}) {
    auto visible = FilterChildren(*snapshot_, children, query);
    size_t cursor = 0;
    for (auto id : visible) {
      while (cursor < children.size() && children[cursor] != id) ++cursor;
      ASSERT_LT(cursor, children.size()) << "query=" << query;
      const auto* node = snapshot_->FindNode(id);
      EXPECT_TRUE(ContainsIgnoreCase(node->name, query) ||
                  ContainsIgnoreCase(node->description, query));
    }
  }
}

TEST(SearchFilterTests, ClampSelection) {
  EXPECT_EQ(ClampSelection(std::nullopt, 0), std::nullopt);
  EXPECT_EQ(ClampSelection(3, 0), std::nullopt);
  EXPECT_EQ(ClampSelection(std::nullopt, 2), std::optional<size_t>(0));
  EXPECT_EQ(ClampSelection(5, 2), std::optional<size_t>(0));
  EXPECT_EQ(ClampSelection(1, 2), std::optional<size_t>(1));
}

TEST(SearchFilterTests, ContainsIgnoreCase) {
  EXPECT_TRUE(ContainsIgnoreCase("Update", "DAT"));
  EXPECT_TRUE(ContainsIgnoreCase("anything", ""));
  EXPECT_FALSE(ContainsIgnoreCase("", "x"));
  EXPECT_FALSE(ContainsIgnoreCase("Update", "updates"));
}

TEST(SearchFilterTests, ContainsIgnoreCaseFoldsNonAsciiLetters) {
  EXPECT_TRUE(ContainsIgnoreCase("Überprüfung", "über"));
  EXPECT_TRUE(ContainsIgnoreCase("überprüfung", "PRÜF"));
  EXPECT_TRUE(ContainsIgnoreCase("ÄPFEL", "äpfel"));
  EXPECT_TRUE(ContainsIgnoreCase("Ωμέγα", "ΩΜΈΓΑ"));
  EXPECT_TRUE(ContainsIgnoreCase("STRASSE", "straße"));
  EXPECT_FALSE(ContainsIgnoreCase("Überprüfung", "uber"));
}

TEST(SearchFilterTests, FilterMatchesNonAsciiNamesAndDescriptions) {
  catalog::CatalogBuilder builder;
  catalog::NodeId root = builder.AddCategory("Werkzeuge");
  catalog::CatalogNode check;
  check.name = "Überprüfung";
  check.command = catalog::RawCommand{"fsck -n /"};
  builder.AddNode(root, check);
  catalog::CatalogNode clean;
  clean.name = "Cleanup";
  clean.description = "Größere Dateien löschen";
  clean.command = catalog::RawCommand{"true"};
  builder.AddNode(root, clean);
  catalog::CatalogNode other;
  other.name = "Reboot";
  other.command = catalog::RawCommand{"reboot"};
  builder.AddNode(root, other);
  CatalogSnapshot snapshot = builder.Build();

  const auto& children = snapshot.FindNode(snapshot.FindCategory("Werkzeuge")->root)->children;
  auto by_name = FilterChildren(snapshot, children, "ÜBER");
  ASSERT_EQ(by_name.size(), 1u);
  EXPECT_EQ(snapshot.FindNode(by_name[0])->name, "Überprüfung");

  auto by_description = FilterChildren(snapshot, children, "GRÖSSERE");
  ASSERT_EQ(by_description.size(), 1u);
  EXPECT_EQ(snapshot.FindNode(by_description[0])->name, "Cleanup");
}

// =============================================================================
// SelectionSet
// =============================================================================

TEST_F(NavigationContractTests, ToggleTwiceRestoresMembership) {
  SelectionSet selection;
  const auto& update = *snapshot_->FindNode(Id("Update"));

  EXPECT_TRUE(selection.Toggle(update));
  EXPECT_TRUE(selection.Contains(update.id));
  EXPECT_TRUE(selection.Toggle(update));
  EXPECT_FALSE(selection.Contains(update.id));
  EXPECT_TRUE(selection.Empty());
}

TEST_F(NavigationContractTests, ToggleIgnoresNodesWithoutMultiSelect) {
  SelectionSet selection;
  const auto& system = *snapshot_->FindNode(Id("System"));
  const auto& restart = *snapshot_->FindNode(Id("Restart"));

  EXPECT_FALSE(selection.Toggle(system));
  EXPECT_FALSE(selection.Toggle(restart));
  EXPECT_TRUE(selection.Empty());
}

TEST_F(NavigationContractTests, DrainReturnsInsertionOrderAndEmpties) {
  SelectionSet selection;
  const auto& update = *snapshot_->FindNode(Id("Update"));
  const auto& disk = *snapshot_->FindNode(Id("Disk Usage"));
  const auto& browser = *snapshot_->FindNode(Id("Browser"));

  selection.Toggle(update);
  selection.Toggle(disk);
  selection.Toggle(browser);
  selection.Toggle(disk);
  selection.Toggle(disk);

  EXPECT_EQ(selection.Size(), 3u);
  auto drained = selection.Drain();
  EXPECT_EQ(drained, (std::vector<catalog::NodeId>{update.id, browser.id, disk.id}));
  EXPECT_TRUE(selection.Empty());
}

}  // namespace
}  // namespace toolshed::navigation::testing
