#include "GraphBuilder.h"

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <stdexcept>
#include <vector>


using namespace ::testing;
using Bacon::BipartiteGraph;
using Bacon::GraphBuilder;
using Bacon::NodeKind;


// Neighbours of v as a plain vector.
static std::vector<int> neighbours(const BipartiteGraph& g, int v) {
    return std::vector<int>(g.Gi.begin() + g.Gp[v], g.Gi.begin() + g.Gp[v + 1]);
}


// ====================
// Test fixture
// ====================

class GraphBuilderTest : public ::testing::Test {
 protected:
    void SetUp() override {
        // X: M1, M2   Y: M1   Z: M3
        builder_.add_actor("X");
        builder_.add_movie("M1");
        builder_.add_movie("M2");
        builder_.add_actor("Y");
        builder_.add_movie("M1");
        builder_.add_actor("Z");
        builder_.add_movie("M3");
    }

    GraphBuilder builder_{10, 10};
};


TEST_F(GraphBuilderTest, CountsUniqueVertices) {
    EXPECT_EQ(builder_.num_actors(), 3);
    EXPECT_EQ(builder_.num_movies(), 3);
    EXPECT_EQ(builder_.num_credits(), 4);

    BipartiteGraph g = builder_.build();
    EXPECT_EQ(g.num_vertices(), 6);
    EXPECT_EQ(g.Gp.size(), 7u);
    EXPECT_EQ(g.Gi.size(), 8u);
}

TEST_F(GraphBuilderTest, ActorsComeBeforeMovies) {
    BipartiteGraph g = builder_.build();
    EXPECT_EQ(g.names, (std::vector<std::string>{"X", "Y", "Z", "M1", "M2", "M3"}));
    for (int v = 0; v < 3; v++)
        EXPECT_EQ(g.kind(v), NodeKind::ACTOR);
    for (int v = 3; v < 6; v++)
        EXPECT_EQ(g.kind(v), NodeKind::MOVIE);
    EXPECT_EQ(g.find_actor("Y"), 1);
    EXPECT_EQ(g.find_actor("M1"), -1);
}

TEST_F(GraphBuilderTest, EdgesAreSymmetricAndBipartite) {
    BipartiteGraph g = builder_.build();
    for (int v = 0; v < g.num_vertices(); v++) {
        for (int u : neighbours(g, v)) {
            EXPECT_NE(g.kind(u), g.kind(v));
            EXPECT_THAT(neighbours(g, u), Contains(v));
        }
    }
    EXPECT_THAT(neighbours(g, 0), ElementsAre(3, 4));
    EXPECT_THAT(neighbours(g, 3), ElementsAre(0, 1));
    EXPECT_THAT(neighbours(g, 5), ElementsAre(2));
}

TEST_F(GraphBuilderTest, BuildDoesNotConsumeBuilder) {
    BipartiteGraph first = builder_.build();
    BipartiteGraph second = builder_.build();
    EXPECT_EQ(first.Gp, second.Gp);
    EXPECT_EQ(first.Gi, second.Gi);
}


// ====================
// Irregular input
// ====================

TEST(GraphBuilderRules, MovieBeforeAnyActorIsSkipped) {
    GraphBuilder builder(0, 0);
    builder.add_movie("Orphan");
    builder.add_actor("X");
    builder.add_movie("M1");

    EXPECT_EQ(builder.orphan_movie_records(), 1);
    EXPECT_EQ(builder.num_movies(), 1);

    BipartiteGraph g = builder.build();
    EXPECT_EQ(g.names, (std::vector<std::string>{"X", "M1"}));
}

TEST(GraphBuilderRules, DuplicateActorExtendsFirstDeclaration) {
    GraphBuilder builder(0, 0);
    builder.add_actor("X");
    builder.add_movie("M1");
    builder.add_actor("Y");
    builder.add_movie("M2");
    builder.add_actor("X");
    builder.add_movie("M2");

    EXPECT_EQ(builder.num_actors(), 2);
    EXPECT_EQ(builder.duplicate_actor_records(), 1);

    BipartiteGraph g = builder.build();
    int x = g.find_actor("X");
    EXPECT_EQ(x, 0);
    // M1 = 2, M2 = 3
    EXPECT_THAT(neighbours(g, x), ElementsAre(2, 3));
}

TEST(GraphBuilderRules, RepeatedCreditIsOneEdge) {
    GraphBuilder builder(0, 0);
    builder.add_actor("X");
    builder.add_movie("M1");
    builder.add_movie("M1");

    EXPECT_EQ(builder.num_credits(), 2);
    BipartiteGraph g = builder.build();
    EXPECT_EQ(g.Gi.size(), 2u);
    EXPECT_THAT(neighbours(g, 0), ElementsAre(1));
}

TEST(GraphBuilderRules, ActorAndMovieMayShareAName) {
    GraphBuilder builder(0, 0);
    builder.add_actor("Same");
    builder.add_movie("Same");

    BipartiteGraph g = builder.build();
    EXPECT_EQ(g.num_actors, 1);
    EXPECT_EQ(g.num_movies, 1);
    EXPECT_EQ(g.find_actor("Same"), 0);
    EXPECT_EQ(g.kind(1), NodeKind::MOVIE);
}

TEST(GraphBuilderRules, AddRecordDispatchesOnKind) {
    GraphBuilder builder(0, 0);
    builder.add_record({NodeKind::ACTOR, "X"});
    builder.add_record({NodeKind::MOVIE, "M1"});
    EXPECT_EQ(builder.num_actors(), 1);
    EXPECT_EQ(builder.num_movies(), 1);
}

TEST(GraphBuilderRules, EmptyBuilderYieldsEmptyGraph) {
    GraphBuilder builder(0, 0);
    BipartiteGraph g = builder.build();
    EXPECT_EQ(g.num_vertices(), 0);
    EXPECT_THAT(g.Gp, ElementsAre(0));
    EXPECT_TRUE(g.Gi.empty());
}

TEST(GraphBuilderRules, NegativeHintsAreRejected) {
    EXPECT_THROW(GraphBuilder(-1, 0), std::invalid_argument);
    EXPECT_THROW(GraphBuilder(0, -1), std::invalid_argument);
}
