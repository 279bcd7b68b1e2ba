/**
 * SPDX-FileCopyrightText: Copyright (c) 2025, dfms contributors.
 * SPDX-License-Identifier: Apache-2.0
 */

#include <filesystem>
#include <functional>
#include <memory>
#include <new>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <dfms/discovery/address_book.hpp>
#include <dfms/discovery/discovery.hpp>
#include <dfms/discovery/remote_discovery.hpp>
#include <dfms/error.hpp>
#include <dfms/manager/node_manager.hpp>
#include <dfms/rpc/manager_client.hpp>
#include <dfms/rpc/manager_server.hpp>
#include <dfms/rpc/protocol.hpp>
#include <dfms/rpc/router.hpp>

#include "utils.hpp"

using namespace dfms;
using namespace dfms::rpc;

TEST(Protocol, Primitives) {
    Writer w;
    w.u8(7).u32(0xDEADBEEF).u64(1ULL << 40).i32(-5).f64(2.5).boolean(true).string("dfms");
    std::vector<std::uint8_t> const raw{1, 2, 3};
    w.bytes(raw);
    auto const buf = w.take();

    Reader r{buf};
    EXPECT_EQ(r.u8(), 7);
    EXPECT_EQ(r.u32(), 0xDEADBEEF);
    EXPECT_EQ(r.u64(), 1ULL << 40);
    EXPECT_EQ(r.i32(), -5);
    EXPECT_EQ(r.f64(), 2.5);
    EXPECT_TRUE(r.boolean());
    EXPECT_EQ(r.string(), "dfms");
    EXPECT_EQ(r.bytes(), raw);
    EXPECT_EQ(r.remaining(), 0);
    EXPECT_THROW(static_cast<void>(r.u8()), std::out_of_range);
}

TEST(Protocol, Descriptor) {
    NodeDescriptor d;
    d.object_id = "grep";
    d.instance_id = "s/grep#1";
    d.kind = NodeKind::CONSUMER;
    d.storage = StorageKind::FILE;
    d.application = "grep";
    d.params = {{"substring", "a"}, {"read_chunk_size", "16"}};
    d.num_inputs = 3;

    Writer w;
    w.descriptor(d).edge(Edge{"s/a", "s/b", EdgeKind::CHILD});
    auto const buf = w.take();
    Reader r{buf};
    auto const got = r.descriptor();
    EXPECT_EQ(got.object_id, d.object_id);
    EXPECT_EQ(got.instance_id, d.instance_id);
    EXPECT_EQ(got.kind, NodeKind::CONSUMER);
    EXPECT_EQ(got.storage, StorageKind::FILE);
    EXPECT_FALSE(got.expected_size.has_value());
    EXPECT_EQ(got.application, "grep");
    EXPECT_EQ(got.params, d.params);
    EXPECT_EQ(got.num_inputs, 3);
    EXPECT_EQ(r.edge(), (Edge{"s/a", "s/b", EdgeKind::CHILD}));
}

TEST(Protocol, Message) {
    Message m{42, Op::NODE_READ, Status::UNKNOWN_NODE, {9, 8}};
    auto const buf = m.encode();
    ASSERT_EQ(buf->size(), Message::header_size + 2);
    auto const got = Message::decode(*buf);
    EXPECT_EQ(got.call_id, 42);
    EXPECT_EQ(got.op, Op::NODE_READ);
    EXPECT_EQ(got.status, Status::UNKNOWN_NODE);
    EXPECT_EQ(got.payload, m.payload);

    EXPECT_THROW(
        static_cast<void>(Message::decode(std::vector<std::uint8_t>(5))), std::out_of_range
    );
    auto bad_op = *buf;
    bad_op[8] = 0;
    EXPECT_THROW(static_cast<void>(Message::decode(bad_op)), std::out_of_range);
    bad_op[8] = 200;
    EXPECT_THROW(static_cast<void>(Message::decode(bad_op)), std::out_of_range);
    auto bad_status = *buf;
    bad_status[9] = 200;
    EXPECT_THROW(static_cast<void>(Message::decode(bad_status)), std::out_of_range);
}

// An error classified on the serving side is raised as the same type by the caller.
TEST(Protocol, ErrorsKeepTheirType) {
    auto round_trip = [](std::exception const& e) {
        raise(classify(e), e.what());
    };
    EXPECT_THROW(round_trip(node_failed("x")), node_failed);
    EXPECT_THROW(round_trip(invalid_state_transition("x")), invalid_state_transition);
    EXPECT_THROW(round_trip(duplicate_consumer("x")), duplicate_consumer);
    EXPECT_THROW(round_trip(unknown_node("x")), unknown_node);
    EXPECT_THROW(round_trip(graph_construction_error("x")), graph_construction_error);
    EXPECT_THROW(round_trip(resource_unavailable("x")), resource_unavailable);
    EXPECT_THROW(round_trip(delivery_error("x")), delivery_error);
    EXPECT_THROW(round_trip(std::invalid_argument("x")), std::invalid_argument);
    EXPECT_THROW(round_trip(std::out_of_range("x")), std::out_of_range);
    EXPECT_THROW(round_trip(std::runtime_error("x")), std::runtime_error);
    EXPECT_THROW(raise(Status::OK, "x"), std::logic_error);
    EXPECT_EQ(classify(std::bad_alloc{}), Status::UNKNOWN_ERROR);
    EXPECT_STREQ(to_string(Op::NODE_CHILDREN), "NODE_CHILDREN");
}

class ManagerServerTest : public ::testing::Test {
  protected:
    void SetUp() override {
        manager = std::make_shared<NodeManager>(
            "m1", GlobalEnvironment->comm_, config::Options{}, discovery
        );
        discovery->add(manager);
        router = std::make_shared<Router>(
            GlobalEnvironment->comm_, GlobalEnvironment->progress_thread_, 11, Duration{5}
        );
        server = std::make_unique<ManagerServer>(manager, router);
    }

    void TearDown() override {
        server.reset();
        router.reset();
    }

    std::vector<std::uint8_t> dispatch(Op op, Writer& args) {
        auto const payload = args.take();
        Reader reader{payload};
        return server->dispatch(op, reader);
    }

    std::shared_ptr<LocalDiscovery> discovery = std::make_shared<LocalDiscovery>();
    std::shared_ptr<NodeManager> manager;
    std::shared_ptr<Router> router;
    std::unique_ptr<ManagerServer> server;
};

TEST_F(ManagerServerTest, Dispatch) {
    Writer reserve;
    reserve.string("s").u64(2);
    EXPECT_TRUE(Reader{dispatch(Op::RESERVE, reserve)}.boolean());

    NodeDescriptor d;
    d.object_id = "a";
    d.instance_id = "s/a";
    Writer reg;
    reg.descriptor(d).string("s");
    EXPECT_EQ(Reader{dispatch(Op::REGISTER_NODE, reg)}.string(), "s/a");

    std::string const text = "remote bytes";
    Writer write;
    write.string("s/a").bytes(to_bytes(text));
    EXPECT_EQ(Reader{dispatch(Op::NODE_WRITE, write)}.u64(), text.size());
    Writer fin;
    fin.string("s/a");
    static_cast<void>(dispatch(Op::NODE_FINALIZE, fin));

    Writer info;
    info.string("s/a");
    auto const got = Reader{dispatch(Op::NODE_INFO, info)}.info();
    EXPECT_EQ(got.state, NodeState::COMPLETE);
    EXPECT_EQ(got.address, (NodeAddress{"s/a", "m1"}));

    Writer open;
    open.string("s/a");
    auto const handle = Reader{dispatch(Op::NODE_OPEN, open)}.u64();
    Writer read;
    read.string("s/a").u64(handle).u64(1024);
    EXPECT_EQ(Reader{dispatch(Op::NODE_READ, read)}.bytes(), to_bytes(text));
    Writer close;
    close.string("s/a").u64(handle);
    static_cast<void>(dispatch(Op::NODE_CLOSE, close));

    Writer shutdown;
    shutdown.string("s");
    EXPECT_EQ(
        Reader{dispatch(Op::SHUTDOWN_SESSION, shutdown)}.i32(),
        static_cast<std::int32_t>(ShutdownStatus::CLEAN)
    );
}

TEST_F(ManagerServerTest, ErrorsPropagate) {
    Writer info;
    info.string("s/missing");
    EXPECT_THROW(static_cast<void>(dispatch(Op::NODE_INFO, info)), unknown_node);
    Writer truncated;
    truncated.string("s");
    EXPECT_THROW(static_cast<void>(dispatch(Op::RESERVE, truncated)), std::out_of_range);
}

TEST(AddressBook, InMemory) {
    InMemoryAddressBook book;
    book.publish("m1", 3);
    EXPECT_EQ(book.lookup("m1", Duration{0}), 3);
    EXPECT_THROW(static_cast<void>(book.lookup("m2", Duration{0.01})), std::out_of_range);
    EXPECT_THROW(book.publish("bad/id", 0), std::invalid_argument);

    // A lookup waits for a later publish.
    std::thread publisher([&] {
        std::this_thread::sleep_for(std::chrono::milliseconds{10});
        book.publish("late", 1);
    });
    EXPECT_EQ(book.lookup("late", Duration{10}), 1);
    publisher.join();
    EXPECT_EQ(book.entries().size(), 2);
}

TEST(AddressBook, File) {
    auto const dir = std::filesystem::temp_directory_path()
                     / ("dfms-address-book-" + std::to_string(GlobalEnvironment->comm_->rank()));
    std::filesystem::remove_all(dir);
    FileAddressBook book{dir};
    book.publish("m1", 0);
    book.publish("m2", 1);
    book.publish("m1", 2);
    EXPECT_EQ(book.lookup("m1", Duration{0}), 2);
    EXPECT_THAT(
        book.entries(),
        ::testing::ElementsAre(
            std::pair<ManagerID const, Rank>{"m1", 2},
            std::pair<ManagerID const, Rank>{"m2", 1}
        )
    );
    EXPECT_THROW(static_cast<void>(book.lookup("m3", Duration{0.01})), std::out_of_range);
    EXPECT_THROW(book.publish("", 0), std::invalid_argument);

    // Another instance over the same directory sees the entries.
    FileAddressBook other{dir};
    EXPECT_EQ(other.lookup("m2", Duration{0}), 1);
    std::filesystem::remove_all(dir);
}

// Every rank serves a manager, rank 0 drives the manager of rank 1 over MPI.
TEST(RemoteManager, CrossRank) {
    auto& env = *GlobalEnvironment;
    if (env.type() == TestEnvironmentType::SINGLE || env.comm_->nranks() < 2) {
        GTEST_SKIP() << "needs at least two ranks";
    }
    auto const rank = env.comm_->rank();
    auto router = std::make_shared<Router>(
        env.comm_, env.progress_thread_, 12, Duration{10}
    );
    auto book = std::make_shared<FileAddressBook>(
        std::filesystem::temp_directory_path() / "dfms-rpc-test"
    );
    auto discovery = std::make_shared<RemoteDiscovery>(router, book, Duration{10});
    auto manager = std::make_shared<NodeManager>(
        "r" + std::to_string(rank), env.comm_, config::Options{}, discovery
    );
    ManagerServer server{manager, router};
    discovery->set_local(manager);
    env.barrier();

    if (rank == 0) {
        auto local = discovery->resolve("r0");
        EXPECT_EQ(local, manager);
        auto remote = discovery->resolve("r1");
        EXPECT_EQ(remote->manager_id(), "r1");

        ASSERT_TRUE(remote->reserve("s", 2));
        NodeDescriptor a;
        a.object_id = "a";
        a.instance_id = "s/a";
        NodeDescriptor b;
        b.object_id = "b";
        b.instance_id = "s/b";
        b.kind = NodeKind::CONSUMER;
        b.application = "copy";
        b.num_inputs = 1;
        EXPECT_EQ(remote->register_node(a, "s"), "s/a");
        remote->register_node(b, "s");
        EXPECT_THROW(remote->register_node(a, "s"), std::invalid_argument);
        remote->link("s", Edge{"s/a", "s/b", EdgeKind::PRODUCER}, "r1", "r1");

        auto node_a = remote->lookup("s/a");
        node_a->write(std::string{"over the wire"});
        node_a->finalize();
        EXPECT_THROW(node_a->write(std::string{"late"}), invalid_state_transition);

        auto node_b = remote->lookup("s/b");
        ASSERT_TRUE(eventually([&] { return node_b->state() == NodeState::COMPLETE; }));
        EXPECT_EQ(read_all_text(*node_b), "over the wire");
        EXPECT_EQ(node_b->checksum(), node_a->checksum());
        EXPECT_THROW(static_cast<void>(remote->lookup("s/nope")), unknown_node);
        EXPECT_EQ(remote->shutdown_session("s"), ShutdownStatus::CLEAN);
    }
    env.barrier();
}
