#include <cassert>
#include <iostream>

#include "Fakes.hpp"
#include "application/RefCorrelator.hpp"

using namespace radview;
using namespace radview::test;
using radview::application::RefCorrelator;

int main() {
    std::cout << "[Test] Starting RefCorrelator Test..." << std::endl;

    FakeRepository repo;
    repo.rid = domain::RepoId::fromUrn(RidA);
    repo.remotes[Actor(AliceKey)] = {
        {"refs/heads/main", Hex('1')},
        {"refs/heads/feature", Hex('2')},
        {"refs/tags/v1", Hex('2')},
    };

    // Single match
    auto onMain = RefCorrelator::MatchingRefs(repo, Actor(AliceKey), Hex('1'));
    assert(onMain.size() == 1);
    assert(onMain[0] == "refs/heads/main");

    // Several matches, in reference name order
    auto two = RefCorrelator::MatchingRefs(repo, Actor(AliceKey), Hex('2'));
    assert(two.size() == 2);
    assert(two[0] == "refs/heads/feature");
    assert(two[1] == "refs/tags/v1");

    // No match
    assert(RefCorrelator::MatchingRefs(repo, Actor(AliceKey), Hex('3')).empty());

    // Unknown remote is absorbed
    assert(RefCorrelator::MatchingRefs(repo, Actor(BobKey), Hex('1')).empty());

    // Store failure is absorbed
    repo.refsUnavailable = true;
    assert(RefCorrelator::MatchingRefs(repo, Actor(AliceKey), Hex('1')).empty());

    std::cout << "[PASS] RefCorrelator Test." << std::endl;
    return 0;
}
