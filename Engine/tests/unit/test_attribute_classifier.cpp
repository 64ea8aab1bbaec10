/**
 * @file test_attribute_classifier.cpp
 * @brief Unit tests for the abstractness digit
 */

#include <gtest/gtest.h>
#include <classify/attribute_classifier.hpp>

using namespace Lexicode;

TEST(AttributeClassifierTest, AbstractOnly) {
    ReferenceSets sets = ReferenceSets::defaults();
    AttributeClassifier classifier(sets);
    EXPECT_EQ(classifier.classify({"idea.n.01", "cognition.n.01", "abstraction.n.06"}), Abstractness::Abstract);
}

TEST(AttributeClassifierTest, ConcreteOnly) {
    ReferenceSets sets = ReferenceSets::defaults();
    AttributeClassifier classifier(sets);
    EXPECT_EQ(classifier.classify({"dog.n.01", "animal.n.01", "organism.n.01"}), Abstractness::Concrete);
}

TEST(AttributeClassifierTest, BothOrNeitherIsMixed) {
    ReferenceSets sets = ReferenceSets::defaults();
    AttributeClassifier classifier(sets);
    EXPECT_EQ(classifier.classify({"x.n.01", "artifact.n.01", "communication.n.02"}), Abstractness::Mixed);
    EXPECT_EQ(classifier.classify({"run.v.01"}), Abstractness::Mixed);
    EXPECT_EQ(classifier.classify({}), Abstractness::Mixed);
}

TEST(AttributeClassifierTest, InjectedSetsReplaceDefaults) {
    ReferenceSets sets;
    sets.abstract_ancestors = {"thought.n.01"};
    sets.concrete_ancestors = {"rock.n.01"};
    AttributeClassifier classifier(sets);
    EXPECT_EQ(classifier.classify({"thought.n.01"}), Abstractness::Abstract);
    EXPECT_EQ(classifier.classify({"abstraction.n.06"}), Abstractness::Mixed);
}

TEST(AttributeClassifierTest, UsesWholeAncestorUnion) {
    ReferenceSets sets = ReferenceSets::defaults();
    AttributeClassifier classifier(sets);

    ConceptGraph g;
    ConceptIndex physical = g.add_concept("1-n", "physical_entity.n.01", PartOfSpeech::Noun);
    ConceptIndex feeling = g.add_concept("2-n", "feeling.n.01", PartOfSpeech::Noun);
    ConceptIndex pain = g.add_concept("3-n", "pain.n.01", PartOfSpeech::Noun);
    ConceptIndex joy = g.add_concept("4-n", "joy.n.01", PartOfSpeech::Noun);
    g.add_hypernym(pain, feeling);
    g.add_hypernym(pain, physical);
    g.add_hypernym(joy, feeling);

    EXPECT_EQ(classifier.classify(g, joy), Abstractness::Abstract);
    EXPECT_EQ(classifier.classify(g, physical), Abstractness::Concrete);
    EXPECT_EQ(classifier.classify(g, pain), Abstractness::Mixed);
    EXPECT_EQ(classifier.classify(g, 99), Abstractness::Mixed);
}
