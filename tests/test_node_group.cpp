#include <catch2/catch_test_macros.hpp>
#include "connection/connection_base.hpp"
#include "connection/node_group.hpp"
#include "core/error.hpp"

#include <memory>

using namespace kvconn;

namespace {

class FakeNode : public ConnectionBase {
public:
    explicit FakeNode(const std::string& uri, bool refuse = false)
        : ConnectionBase(ConnectionParameters::parse(uri)), refuse_(refuse) {}

protected:
    void open_transport() override {
        if (refuse_) {
            throw ConnectionError("Connection refused");
        }
        open_ = true;
    }
    void close_transport() override { open_ = false; }
    bool transport_open() const override { return open_; }
    Reply send_and_receive(const RawCommand&) override { return Reply::status("OK"); }

private:
    bool refuse_;
    bool open_ = false;
};

} // anonymous namespace

TEST_CASE("NodeGroup: keeps insertion order", "[node_group]") {
    NodeGroup group("cache");
    group.add(std::make_unique<FakeNode>("tcp://10.0.0.1:6379"));
    group.add(std::make_unique<FakeNode>("tcp://10.0.0.2:6379?alias=b"));
    group.add(std::make_unique<FakeNode>("unix:/tmp/c.sock"));

    CHECK(group.name() == "cache");
    CHECK(group.size() == 3);
    CHECK(group.ids() == std::vector<std::string>{"10.0.0.1:6379", "b", "/tmp/c.sock"});
    CHECK(group.at(3) == nullptr);
}

TEST_CASE("NodeGroup: null connection is rejected", "[node_group]") {
    NodeGroup group;
    CHECK_THROWS_AS(group.add(nullptr), ContractViolation);
    CHECK(group.size() == 0);
}

TEST_CASE("NodeGroup: lookup and removal", "[node_group]") {
    NodeGroup group;
    group.add(std::make_unique<FakeNode>("tcp://10.0.0.1:6379?alias=a"));
    group.add(std::make_unique<FakeNode>("tcp://10.0.0.2:6379?alias=b"));

    IConnection* b = group.connection_by_id("b");
    REQUIRE(b != nullptr);
    CHECK(group.connection_by_id("missing") == nullptr);

    CHECK(group.remove(*b));
    CHECK(group.size() == 1);
    CHECK(group.connection_by_id("b") == nullptr);

    FakeNode stranger("tcp://10.0.0.3:6379");
    CHECK_FALSE(group.remove(stranger));
}

TEST_CASE("NodeGroup: connect stops at the first failing node", "[node_group]") {
    NodeGroup group;
    group.add(std::make_unique<FakeNode>("tcp://10.0.0.1:6379"));
    group.add(std::make_unique<FakeNode>("tcp://10.0.0.2:6379", true));
    group.add(std::make_unique<FakeNode>("tcp://10.0.0.3:6379"));

    CHECK_THROWS_AS(group.connect(), ConnectionError);
    CHECK(group.at(0)->is_connected());
    CHECK_FALSE(group.at(1)->is_connected());
    CHECK_FALSE(group.at(2)->is_connected());
    CHECK(group.is_connected());

    group.disconnect();
    CHECK_FALSE(group.is_connected());
}
