#include <gtest/gtest.h>
#include "common/errors.hpp"
#include "graph/link_index.hpp"
#include "search/ancestor_search.hpp"
#include "search/dsep_search.hpp"

using namespace tsdsep;

namespace {

NodeList nodes(std::initializer_list<Node> list) { return NodeList(list); }

// 0 <-- 1 <-- ... <-- length, every link at lag -1
LinkMap laggedChain(int length) {
    LinkMap links;
    for (int k = 0; k < length; ++k) links[k] = {Link(k + 1, -1)};
    links[length] = {};
    return links;
}

// A --> B --> C at lag zero
LinkMap chain() {
    return LinkMap{{0, {}}, {1, {Link(0, 0)}}, {2, {Link(1, 0)}}};
}

// A --> B <-- C at lag zero
LinkMap collider() {
    return LinkMap{{0, {}}, {1, {Link(0, 0), Link(2, 0)}}, {2, {}}};
}

// A <-- B --> C at lag zero
LinkMap forkGraph() {
    return LinkMap{{0, {Link(1, 0)}}, {1, {}}, {2, {Link(1, 0)}}};
}

} // namespace

// ─── AncestorSearch ───────────────────────────────────────────

TEST(AncestorSearchTest, ChainHorizonEqualsLength) {
    for (int length : {1, 2, 4, 7}) {
        LinkIndex index(laggedChain(length));
        AncestorSearch search(index, {});

        AncestorResult r = search.run({Node(0, 0)}, {}, AncestorMode::NonRepeating);
        EXPECT_EQ(r.max_lag, length);

        const NodeList& anc = r.ancestors.at(Node(0, 0));
        ASSERT_EQ(anc.size(), static_cast<size_t>(length));
        for (int k = 0; k < length; ++k) {
            EXPECT_EQ(anc[k], Node(k + 1, -(k + 1)));
        }
    }
}

TEST(AncestorSearchTest, RepeatedLinkIsFollowedOnce) {
    LinkIndex index(LinkMap{{0, {Link(0, -1)}}});
    AncestorSearch search(index, {});

    AncestorResult r = search.run({Node(0, 0)}, {}, AncestorMode::NonRepeating);
    EXPECT_EQ(r.max_lag, 1);
    EXPECT_EQ(r.ancestors.at(Node(0, 0)), nodes({{0, -1}}));
}

TEST(AncestorSearchTest, SeedLagCountsTowardsHorizon) {
    LinkIndex index(LinkMap{{0, {}}});
    AncestorSearch search(index, {});

    AncestorResult r = search.run({Node(0, -2)}, {}, AncestorMode::NonRepeating);
    EXPECT_EQ(r.max_lag, 2);
    EXPECT_TRUE(r.ancestors.at(Node(0, -2)).empty());
}

TEST(AncestorSearchTest, ConditioningBlocksAncestry) {
    LinkIndex index(laggedChain(3));
    AncestorSearch search(index, {});

    AncestorResult r = search.run({Node(0, 0)}, {Node(2, -2)}, AncestorMode::NonRepeating);
    EXPECT_EQ(r.max_lag, 1);
    EXPECT_EQ(r.ancestors.at(Node(0, 0)), nodes({{1, -1}}));
}

TEST(AncestorSearchTest, SeedsAreNotConditioned) {
    LinkIndex index(laggedChain(2));
    AncestorSearch search(index, {});

    AncestorResult r = search.run({Node(1, -1)}, {Node(1, -1)}, AncestorMode::NonRepeating);
    EXPECT_EQ(r.ancestors.at(Node(1, -1)), nodes({{2, -2}}));
    EXPECT_EQ(r.max_lag, 2);
}

TEST(AncestorSearchTest, HorizonIsMaxOverSeeds) {
    LinkIndex index(LinkMap{{0, {}}, {1, {Link(0, -3)}}});
    AncestorSearch search(index, {});

    AncestorResult r = search.run({Node(0, 0), Node(1, 0)}, {}, AncestorMode::NonRepeating);
    EXPECT_EQ(r.max_lag, 3);
    EXPECT_TRUE(r.ancestors.at(Node(0, 0)).empty());
    EXPECT_EQ(r.ancestors.at(Node(1, 0)), nodes({{0, -3}}));
}

TEST(AncestorSearchTest, MaxLagModeFollowsRepeats) {
    LinkIndex index(LinkMap{{0, {Link(0, -1)}}});
    AncestorSearch search(index, {});

    AncestorResult r = search.run({Node(0, 0)}, {}, AncestorMode::MaxLag, 3);
    EXPECT_EQ(r.max_lag, 3);
    EXPECT_EQ(r.ancestors.at(Node(0, 0)), nodes({{0, -1}, {0, -2}, {0, -3}}));
}

TEST(AncestorSearchTest, MaxLagModeRequiresBound) {
    LinkIndex index(LinkMap{{0, {Link(0, -1)}}});
    AncestorSearch search(index, {});
    EXPECT_THROW(search.run({Node(0, 0)}, {}, AncestorMode::MaxLag), MissingBoundError);
}

TEST(AncestorSearchTest, SelectionVariablesAreConditioned) {
    // 2 is a selection variable parenting 1
    LinkIndex index(LinkMap{{0, {}}, {1, {Link(2, 0)}}, {2, {Link(0, 0)}}});
    AncestorSearch search(index, {2});

    AncestorResult r = search.run({Node(1, 0)}, {}, AncestorMode::NonRepeating);
    EXPECT_TRUE(r.ancestors.at(Node(1, 0)).empty());

    AncestorSearch unselected(index, {});
    r = unselected.run({Node(1, 0)}, {}, AncestorMode::NonRepeating);
    EXPECT_EQ(r.ancestors.at(Node(1, 0)), nodes({{2, 0}, {0, 0}}));
}

// ─── DSeparationSearch: motifs ────────────────────────────────

TEST(DSeparationSearchTest, ChainOpenWithoutConditioning) {
    LinkIndex index(chain());
    DSeparationSearch search(index, {});

    auto path = search.findPath({Node(0, 0)}, {Node(2, 0)}, {}, 0);
    ASSERT_TRUE(path.has_value());
    EXPECT_EQ(*path, nodes({{0, 0}, {1, 0}, {2, 0}}));
}

TEST(DSeparationSearchTest, ChainBlockedByMiddle) {
    LinkIndex index(chain());
    DSeparationSearch search(index, {});
    EXPECT_FALSE(search.findPath({Node(0, 0)}, {Node(2, 0)}, {Node(1, 0)}, 0).has_value());
}

TEST(DSeparationSearchTest, ColliderBlocksUntilConditioned) {
    LinkIndex index(collider());
    DSeparationSearch search(index, {});

    EXPECT_FALSE(search.findPath({Node(0, 0)}, {Node(2, 0)}, {}, 0).has_value());

    auto path = search.findPath({Node(0, 0)}, {Node(2, 0)}, {Node(1, 0)}, 0);
    ASSERT_TRUE(path.has_value());
    EXPECT_EQ(*path, nodes({{0, 0}, {1, 0}, {2, 0}}));
}

TEST(DSeparationSearchTest, ConditionedDescendantOpensCollider) {
    // A --> B <-- C, B --> D
    LinkMap links = collider();
    links[3] = {Link(1, 0)};
    LinkIndex index(links);
    DSeparationSearch search(index, {});

    EXPECT_FALSE(search.findPath({Node(0, 0)}, {Node(2, 0)}, {}, 0).has_value());

    auto path = search.findPath({Node(0, 0)}, {Node(2, 0)}, {Node(3, 0)}, 0);
    ASSERT_TRUE(path.has_value());
    EXPECT_EQ(path->front(), Node(0, 0));
    EXPECT_EQ(path->back(), Node(2, 0));
}

TEST(DSeparationSearchTest, ForkOpenUntilConditioned) {
    LinkIndex index(forkGraph());
    DSeparationSearch search(index, {});

    auto path = search.findPath({Node(0, 0)}, {Node(2, 0)}, {}, 0);
    ASSERT_TRUE(path.has_value());
    EXPECT_EQ(*path, nodes({{0, 0}, {1, 0}, {2, 0}}));

    EXPECT_FALSE(search.findPath({Node(0, 0)}, {Node(2, 0)}, {Node(1, 0)}, 0).has_value());
}

TEST(DSeparationSearchTest, SelectionVariableOpensCommonChild) {
    // 2 is a selection child of 0 and 1
    LinkIndex index(LinkMap{{0, {}}, {1, {}}, {2, {Link(0, 0), Link(1, 0)}}});

    DSeparationSearch selected(index, {2});
    auto path = selected.findPath({Node(0, 0)}, {Node(1, 0)}, {}, 0);
    ASSERT_TRUE(path.has_value());
    EXPECT_EQ(*path, nodes({{0, 0}, {2, 0}, {1, 0}}));

    DSeparationSearch unselected(index, {});
    EXPECT_FALSE(unselected.findPath({Node(0, 0)}, {Node(1, 0)}, {}, 0).has_value());
}

// ─── DSeparationSearch: time ──────────────────────────────────

TEST(DSeparationSearchTest, LaggedMediatorBlocks) {
    // 0 --> 0 and 0 --> 1, both at lag -1
    LinkIndex index(LinkMap{{0, {Link(0, -1)}}, {1, {Link(0, -1)}}});
    DSeparationSearch search(index, {});

    auto path = search.findPath({Node(0, -2)}, {Node(1, 0)}, {}, 3);
    ASSERT_TRUE(path.has_value());
    EXPECT_EQ(*path, nodes({{0, -2}, {0, -1}, {1, 0}}));

    EXPECT_FALSE(search.findPath({Node(0, -2)}, {Node(1, 0)}, {Node(0, -1)}, 3).has_value());
}

TEST(DSeparationSearchTest, HorizonTruncatesPaths) {
    // 0 <-- 2 --> 1, the common cause two steps back
    LinkIndex index(LinkMap{{0, {Link(2, -2)}}, {1, {Link(2, -2)}}, {2, {}}});
    DSeparationSearch search(index, {});

    auto path = search.findPath({Node(0, 0)}, {Node(1, 0)}, {}, 2);
    ASSERT_TRUE(path.has_value());
    EXPECT_EQ(*path, nodes({{0, 0}, {2, -2}, {1, 0}}));

    EXPECT_FALSE(search.findPath({Node(0, 0)}, {Node(1, 0)}, {}, 1).has_value());
}

TEST(DSeparationSearchTest, AnyPairConnects) {
    LinkIndex index(chain());
    DSeparationSearch search(index, {});

    // (1,-1) lies in another time slice, (0,0)-(2,0) is open
    auto path = search.findPath({Node(0, 0)}, {Node(1, -1), Node(2, 0)}, {}, 1);
    ASSERT_TRUE(path.has_value());
    EXPECT_EQ(path->back(), Node(2, 0));
}

// ─── DSeparationSearch: backdoor ──────────────────────────────

TEST(DSeparationSearchTest, BackdoorSkipsCausalPath) {
    // X <-- L --> Y and X --> Y
    LinkIndex index(LinkMap{{0, {Link(2, 0)}}, {1, {Link(0, 0), Link(2, 0)}}, {2, {}}});
    DSeparationSearch search(index, {});

    auto backdoor = search.findPath({Node(0, 0)}, {Node(1, 0)}, {}, 0, true);
    ASSERT_TRUE(backdoor.has_value());
    EXPECT_EQ(*backdoor, nodes({{0, 0}, {2, 0}, {1, 0}}));

    EXPECT_FALSE(search.findPath({Node(0, 0)}, {Node(1, 0)}, {Node(2, 0)}, 0, true).has_value());

    auto direct = search.findPath({Node(0, 0)}, {Node(1, 0)}, {Node(2, 0)}, 0);
    ASSERT_TRUE(direct.has_value());
    EXPECT_EQ(*direct, nodes({{0, 0}, {1, 0}}));
}
