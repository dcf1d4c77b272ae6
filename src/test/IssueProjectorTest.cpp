#include <cassert>
#include <iostream>

#include "Fakes.hpp"
#include "application/IssueProjector.hpp"

using namespace radview;
using namespace radview::test;

int main() {
    std::cout << "[Test] Starting IssueProjector Test..." << std::endl;

    FakeAliasStore aliases;
    aliases.names[Actor(BobKey)] = "bob";
    application::Projectors projectors(aliases);
    application::IssueProjector projector(projectors);

    auto issue = MakeIssue("Crash on start", AliceKey, '1', 50);
    issue.labels = {"bug", "good-first-issue"};
    issue.assignees = {Actor(BobKey)};
    auto reply = MakeComment('2', BobKey, "confirmed", 60);
    reply.replyTo = Hex('1');
    issue.comments.push_back(reply);
    issue.state = domain::IssueState::closed(domain::IssueState::CloseReason::Solved);

    auto j = projector.project(Hex('a'), issue);
    assert(j["id"] == std::string(40, 'a'));
    assert(j["author"]["id"] == "did:key:" + AliceKey);
    assert(!j["author"].contains("alias"));
    assert(j["title"] == "Crash on start");
    assert(j["state"]["status"] == "closed");
    assert(j["state"]["reason"] == "solved");
    assert(j["assignees"].size() == 1);
    assert(j["assignees"][0]["alias"] == "bob");
    assert(j["labels"] == nlohmann::json({"bug", "good-first-issue"}));

    // Issue threads are plain
    assert(j["discussion"].size() == 2);
    assert(!j["discussion"][0].contains("location"));
    assert(j["discussion"][1]["replyTo"] == std::string(40, '1'));

    assert(j.size() == 7);

    // Open state
    issue.state = domain::IssueState::open();
    auto open = projector.project(Hex('a'), issue);
    assert(open["state"] == nlohmann::json({{"status", "open"}}));

    // Alias failures are fatal for the entity
    aliases.failing.insert(Actor(BobKey));
    bool threw = false;
    try {
        projector.project(Hex('a'), issue);
    } catch (const domain::StorageError&) {
        threw = true;
    }
    assert(threw);

    std::cout << "[PASS] IssueProjector Test." << std::endl;
    return 0;
}
