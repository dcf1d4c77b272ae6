#include <cassert>
#include <iostream>
#include <stdexcept>

#include "Fakes.hpp"
#include "application/AuthorResolver.hpp"

using namespace radview;
using namespace radview::test;

int main() {
    std::cout << "[Test] Starting AuthorResolver Test..." << std::endl;

    FakeAliasStore aliases;
    aliases.names[Actor(AliceKey)] = "alice";
    application::AuthorResolver resolver(aliases);

    // Known alias
    auto alice = resolver.resolveJson(AuthorOf(AliceKey));
    assert(alice["id"] == "did:key:" + AliceKey);
    assert(alice["alias"] == "alice");
    assert(alice.size() == 2);

    // No alias: the key is absent, never null
    auto bob = resolver.resolveJson(Actor(BobKey));
    assert(bob["id"] == "did:key:" + BobKey);
    assert(!bob.contains("alias"));
    assert(bob.size() == 1);

    // Raw ids and domain authors resolve the same way
    assert(resolver.resolveJson(Actor(AliceKey)) == resolver.resolveJson(AuthorOf(AliceKey)));

    // Store failures propagate to the caller
    aliases.failing.insert(Actor(CarolKey));
    bool threw = false;
    try {
        resolver.resolve(Actor(CarolKey));
    } catch (const domain::StorageError&) {
        threw = true;
    }
    assert(threw && "Alias store failure must not be swallowed.");

    // Actor id parsing
    assert(Actor("did:key:" + BobKey) == Actor(BobKey));
    threw = false;
    try {
        domain::ActorId::fromString("not-a-key");
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    std::cout << "[PASS] AuthorResolver Test." << std::endl;
    return 0;
}
