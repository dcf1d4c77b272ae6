#include <cassert>
#include <iostream>

#include "Fakes.hpp"
#include "application/Projectors.hpp"

using namespace radview;
using namespace radview::test;

using Flavor = application::CommentProjector::Flavor;

namespace {

void testPlainComment(const application::Projectors& p) {
    std::cout << "[Test] Plain comment keys..." << std::endl;

    auto comment = MakeComment('1', AliceKey, "first", 100);
    comment.embeds.push_back(domain::Embed{"log.txt", "git:" + std::string(40, 'e')});
    comment.reactions.push_back(React("\xF0\x9F\x91\x8D", BobKey));

    auto j = p.comments.projectComment(comment, Flavor::Plain);
    assert(j["id"] == std::string(40, '1'));
    assert(j["author"]["alias"] == "alice");
    assert(j["body"] == "first");
    assert(j["timestamp"] == 100);
    assert(j["replyTo"].is_null());
    assert(j["resolved"] == false);
    assert(!j.contains("location"));
    assert(j["embeds"].size() == 1);
    assert(j["embeds"][0]["name"] == "log.txt");
    assert(j["reactions"].size() == 1);
    assert(!j["reactions"][0].contains("location"));
    assert(j["edits"].size() == 1);
    assert(j["edits"][0]["body"] == "first");
    assert(j["edits"][0]["timestamp"] == 100);
    assert(j["edits"][0]["embeds"].empty());
}

void testLocatedComment(const application::Projectors& p) {
    std::cout << "[Test] Located comment keys..." << std::endl;

    auto reply = MakeComment('2', BobKey, "reply", 200);
    reply.replyTo = Hex('1');
    reply.resolved = true;
    reply.location = Loc("src/lib.rs", 10, 12);
    reply.reactions.push_back(React("\xF0\x9F\x8E\x89", AliceKey));

    auto j = p.comments.projectComment(reply, Flavor::Located);
    assert(j["replyTo"] == std::string(40, '1'));
    assert(j["resolved"] == true);
    assert(j["location"]["path"] == "src/lib.rs");
    // The comment location is attached to its reaction groups
    assert(j["reactions"][0]["location"] == j["location"]);

    // Located flavor keeps the key even without a location
    auto general = MakeComment('3', BobKey, "general", 300);
    auto g = p.comments.projectComment(general, Flavor::Located);
    assert(g.contains("location"));
    assert(g["location"].is_null());
}

void testEdits(const application::Projectors& p) {
    std::cout << "[Test] Edit projection..." << std::endl;

    // No edits at all is valid
    domain::Comment bare;
    bare.id = Hex('4');
    bare.author = Actor(CarolKey);
    auto j = p.comments.projectComment(bare, Flavor::Plain);
    assert(j["edits"].is_array() && j["edits"].empty());

    std::vector<domain::Edit> edits = {
        domain::Edit{Actor(AliceKey), "v1", At(1), {}},
        domain::Edit{Actor(AliceKey), "v2", At(2), {domain::Embed{"img.png", "git:abc"}}},
    };
    auto e = p.comments.projectEdits(edits);
    assert(e.size() == 2);
    assert(e[0]["body"] == "v1");
    assert(e[1]["body"] == "v2");
    assert(e[1]["embeds"][0]["content"] == "git:abc");
    assert(e[1]["author"]["id"] == "did:key:" + AliceKey);
}

void testThreadOrder(const application::Projectors& p) {
    std::cout << "[Test] Thread keeps its order..." << std::endl;

    std::vector<domain::Comment> thread = {
        MakeComment('9', AliceKey, "late id, first", 5),
        MakeComment('1', BobKey, "early id, second", 1),
    };
    auto j = p.comments.projectThread(thread, Flavor::Plain);
    assert(j.size() == 2);
    assert(j[0]["body"] == "late id, first");
    assert(j[1]["body"] == "early id, second");
}

} // namespace

int main() {
    std::cout << "[Test] Starting CommentProjector Test..." << std::endl;

    FakeAliasStore aliases;
    aliases.names[Actor(AliceKey)] = "alice";
    application::Projectors projectors(aliases);

    testPlainComment(projectors);
    testLocatedComment(projectors);
    testEdits(projectors);
    testThreadOrder(projectors);

    std::cout << "[PASS] CommentProjector Test." << std::endl;
    return 0;
}
