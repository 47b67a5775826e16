#include <gtest/gtest.h>
#include <memory>
#include "mem_kv_store.hpp"
#include "../src/persist/bridge.hpp"
#include "../src/codec/tree_codec.hpp"

namespace treefs::persist
{
    namespace
    {
        using test::mem_kv_store;

        void build_sample(fs::directory &root)
        {
            ASSERT_TRUE(root.add_entry(std::make_unique<fs::file>("a.txt", std::string_view("hello"))));
            ASSERT_TRUE(root.add_entry(std::make_unique<fs::directory>("sub")));
            ASSERT_TRUE(root.get_dir("sub")->add_entry(std::make_unique<fs::file>("b.bin", std::vector<uint8_t>{1, 2, 3})));
        }

        const std::string fs_record_key()
        {
            return std::string(FS_COLLECTION) + "/" + FS_RECORD_KEY;
        }

        TEST(Bridge, InitConnects)
        {
            mem_kv_store kv;
            bridge b(kv);
            EXPECT_EQ(BRIDGE_STATE::UNINITIALIZED, b.get_state());
            EXPECT_EQ(0, b.init());
            EXPECT_EQ(BRIDGE_STATE::CONNECTED, b.get_state());
            EXPECT_TRUE(kv.is_open());

            // Already connected. No new open attempt.
            EXPECT_EQ(0, b.init());
            EXPECT_EQ(1, kv.open_calls);
            EXPECT_EQ(0u, kv.signals().listener_count());
        }

        TEST(Bridge, InitWithDeferredOpen)
        {
            mem_kv_store kv;
            kv.open_mode = test::OPEN_MODE::OPEN_DEFERRED;
            bridge b(kv, 2000);
            EXPECT_EQ(0, b.init());
            EXPECT_EQ(BRIDGE_STATE::CONNECTED, b.get_state());
        }

        TEST(Bridge, ConnectTimeoutDegrades)
        {
            mem_kv_store kv;
            kv.open_mode = test::OPEN_MODE::OPEN_SILENT;
            bridge b(kv, 50);

            EXPECT_EQ(-1, b.init());
            EXPECT_EQ(BRIDGE_STATE::DEGRADED, b.get_state());
            EXPECT_EQ(0u, kv.signals().listener_count());

            // Tree is usable in memory but never persisted.
            build_sample(b.get_root());
            EXPECT_EQ(8u, b.get_root().size());
            EXPECT_EQ(-1, b.save());
            EXPECT_EQ(0, kv.put_calls);
            EXPECT_TRUE(kv.records->empty());
            EXPECT_EQ(-1, b.load());
        }

        TEST(Bridge, OpenErrorDegrades)
        {
            mem_kv_store kv;
            kv.open_mode = test::OPEN_MODE::OPEN_ERROR;
            bridge b(kv);

            EXPECT_EQ(-1, b.init());
            EXPECT_EQ(BRIDGE_STATE::DEGRADED, b.get_state());
            EXPECT_EQ(-1, b.save());
        }

        TEST(Bridge, ReconnectFromDegraded)
        {
            mem_kv_store kv;
            kv.open_mode = test::OPEN_MODE::OPEN_ERROR;
            bridge b(kv);
            ASSERT_EQ(-1, b.init());

            kv.open_mode = test::OPEN_MODE::OPEN_SUCCESS;
            EXPECT_EQ(0, b.init());
            EXPECT_EQ(BRIDGE_STATE::CONNECTED, b.get_state());
            EXPECT_EQ(2, kv.open_calls);
        }

        TEST(Bridge, SaveBeforeInitFails)
        {
            mem_kv_store kv;
            bridge b(kv);
            EXPECT_EQ(-1, b.save());
            EXPECT_EQ(-1, b.load());
            EXPECT_EQ(0, kv.put_calls);
        }

        TEST(Bridge, LoadWithoutRecord)
        {
            mem_kv_store kv;
            bridge b(kv);
            ASSERT_EQ(0, b.init());
            build_sample(b.get_root());

            EXPECT_EQ(0, b.load());
            EXPECT_EQ(BRIDGE_STATE::LOADED, b.get_state());
            EXPECT_EQ(2u, b.get_root().count());

            // Loads only once.
            EXPECT_EQ(-1, b.load());
        }

        TEST(Bridge, SaveThenLoadRestoresTree)
        {
            std::shared_ptr<mem_kv_store::record_map> records = std::make_shared<mem_kv_store::record_map>();
            {
                mem_kv_store kv(records);
                bridge b(kv);
                ASSERT_EQ(0, b.init());
                build_sample(b.get_root());
                EXPECT_EQ(0, b.save());
                EXPECT_EQ(1u, records->count(fs_record_key()));
            }

            mem_kv_store kv(records);
            bridge b(kv);
            ASSERT_EQ(0, b.init());

            fs::directory &root = b.get_root();
            const ino_t root_ino = root.get_ino();
            ASSERT_EQ(0, b.load());

            // The same root instance now holds the persisted children.
            EXPECT_EQ(&root, &b.get_root());
            EXPECT_EQ(root_ino, root.get_ino());
            EXPECT_EQ(std::vector<std::string>({"a.txt", "sub"}), root.get_entry_names());
            EXPECT_EQ(8u, root.size());
            EXPECT_EQ(&root, root.get_dir("sub")->get_parent());
            EXPECT_EQ("//sub/b.bin", root.get_files()[1]->path());

            // Saving the loaded tree reproduces the same record.
            const std::vector<uint8_t> first = records->at(fs_record_key());
            EXPECT_EQ(0, b.save());
            EXPECT_EQ(first, records->at(fs_record_key()));
        }

        TEST(Bridge, SaveOverwritesRecord)
        {
            mem_kv_store kv;
            bridge b(kv);
            ASSERT_EQ(0, b.init());
            build_sample(b.get_root());
            ASSERT_EQ(0, b.save());

            ASSERT_TRUE(b.get_root().delete_entry("sub"));
            ASSERT_EQ(0, b.save());
            EXPECT_EQ(2, kv.put_calls);

            const std::vector<uint8_t> &record = kv.records->at(fs_record_key());
            std::unique_ptr<fs::directory> decoded;
            ASSERT_EQ(0, codec::decode(decoded, record.data(), record.size()));
            EXPECT_EQ(std::vector<std::string>({"a.txt"}), decoded->get_entry_names());
        }

        TEST(Bridge, FailedGetLeavesTreeIntact)
        {
            mem_kv_store kv;
            bridge b(kv);
            ASSERT_EQ(0, b.init());
            build_sample(b.get_root());

            kv.fail_get = true;
            EXPECT_EQ(-1, b.load());
            EXPECT_EQ(BRIDGE_STATE::CONNECTED, b.get_state());
            EXPECT_EQ(2u, b.get_root().count());
            EXPECT_EQ(8u, b.get_root().size());
        }

        TEST(Bridge, CorruptRecordLeavesTreeIntact)
        {
            mem_kv_store kv;
            bridge b(kv);
            ASSERT_EQ(0, b.init());
            build_sample(b.get_root());
            ASSERT_EQ(0, b.save());

            std::vector<uint8_t> &record = kv.records->at(fs_record_key());
            record[record.size() - 1] ^= 0x01;

            ASSERT_TRUE(b.get_root().delete_entry("a.txt"));
            EXPECT_EQ(-1, b.load());
            EXPECT_EQ(std::vector<std::string>({"sub"}), b.get_root().get_entry_names());
            EXPECT_EQ(BRIDGE_STATE::CONNECTED, b.get_state());
        }

        TEST(Bridge, FailedPut)
        {
            mem_kv_store kv;
            bridge b(kv);
            ASSERT_EQ(0, b.init());
            kv.fail_put = true;
            EXPECT_EQ(-1, b.save());
            EXPECT_TRUE(kv.records->empty());
        }

        TEST(Bridge, LoadsOnHostReady)
        {
            std::shared_ptr<mem_kv_store::record_map> records = std::make_shared<mem_kv_store::record_map>();
            {
                mem_kv_store kv(records);
                bridge b(kv);
                ASSERT_EQ(0, b.init());
                build_sample(b.get_root());
                ASSERT_EQ(0, b.save());
            }

            mem_kv_store kv(records);
            bridge b(kv);
            ASSERT_EQ(0, b.init());

            async::signal_target host;
            b.attach_host(host);
            EXPECT_EQ(1u, host.listener_count());
            EXPECT_EQ(0u, b.get_root().count());

            EXPECT_EQ(1, host.emit(HOST_READY_SIGNAL));
            EXPECT_EQ(BRIDGE_STATE::LOADED, b.get_state());
            EXPECT_EQ(2u, b.get_root().count());

            // Local change is not overwritten by a second ready signal.
            ASSERT_TRUE(b.get_root().delete_entry("sub"));
            EXPECT_EQ(0, host.emit(HOST_READY_SIGNAL));
            EXPECT_EQ(1u, b.get_root().count());
        }

        // Persists the sample tree into the given records and returns the record bytes.
        const std::vector<uint8_t> persist_sample(std::shared_ptr<mem_kv_store::record_map> records)
        {
            mem_kv_store kv(records);
            bridge b(kv);
            EXPECT_EQ(0, b.init());
            build_sample(b.get_root());
            EXPECT_EQ(0, b.save());
            return records->count(fs_record_key()) == 1 ? records->at(fs_record_key()) : std::vector<uint8_t>();
        }

        TEST(Bridge, ReadyBeforeConnectLoadsAfterInit)
        {
            std::shared_ptr<mem_kv_store::record_map> records = std::make_shared<mem_kv_store::record_map>();
            const std::vector<uint8_t> persisted = persist_sample(records);
            ASSERT_FALSE(persisted.empty());

            mem_kv_store kv(records);
            bridge b(kv);
            async::signal_target host;
            b.attach_host(host);

            EXPECT_EQ(1, host.emit(HOST_READY_SIGNAL));
            EXPECT_EQ(BRIDGE_STATE::UNINITIALIZED, b.get_state());
            EXPECT_EQ(0u, b.get_root().count());

            ASSERT_EQ(0, b.init());
            EXPECT_EQ(BRIDGE_STATE::LOADED, b.get_state());
            EXPECT_EQ(std::vector<std::string>({"a.txt", "sub"}), b.get_root().get_entry_names());

            // Saving right after startup keeps the persisted tree.
            ASSERT_EQ(0, b.save());
            EXPECT_EQ(persisted, records->at(fs_record_key()));
        }

        TEST(Bridge, ReadyBeforeDeferredConnect)
        {
            std::shared_ptr<mem_kv_store::record_map> records = std::make_shared<mem_kv_store::record_map>();
            ASSERT_FALSE(persist_sample(records).empty());

            mem_kv_store kv(records);
            kv.open_mode = test::OPEN_MODE::OPEN_DEFERRED;
            bridge b(kv, 2000);
            async::signal_target host;
            b.attach_host(host);
            host.emit(HOST_READY_SIGNAL);

            ASSERT_EQ(0, b.init());
            EXPECT_EQ(BRIDGE_STATE::LOADED, b.get_state());
            EXPECT_EQ(8u, b.get_root().size());
        }

        TEST(Bridge, ReadyWhileDegradedDoesNotLoad)
        {
            std::shared_ptr<mem_kv_store::record_map> records = std::make_shared<mem_kv_store::record_map>();
            const std::vector<uint8_t> persisted = persist_sample(records);
            ASSERT_FALSE(persisted.empty());

            mem_kv_store kv(records);
            kv.open_mode = test::OPEN_MODE::OPEN_ERROR;
            bridge b(kv);
            ASSERT_EQ(-1, b.init());

            async::signal_target host;
            b.attach_host(host);
            host.emit(HOST_READY_SIGNAL);

            EXPECT_EQ(BRIDGE_STATE::DEGRADED, b.get_state());
            EXPECT_EQ(0u, b.get_root().count());
            EXPECT_EQ(-1, b.save());
            EXPECT_EQ(persisted, records->at(fs_record_key()));

            // A later reconnect performs the load the host asked for.
            kv.open_mode = test::OPEN_MODE::OPEN_SUCCESS;
            ASSERT_EQ(0, b.init());
            EXPECT_EQ(BRIDGE_STATE::LOADED, b.get_state());
            EXPECT_EQ(2u, b.get_root().count());
        }

        TEST(Bridge, ShutdownDropsDeferredLoad)
        {
            std::shared_ptr<mem_kv_store::record_map> records = std::make_shared<mem_kv_store::record_map>();
            ASSERT_FALSE(persist_sample(records).empty());

            mem_kv_store kv(records);
            bridge b(kv);
            async::signal_target host;
            b.attach_host(host);
            host.emit(HOST_READY_SIGNAL);
            b.shutdown();

            ASSERT_EQ(0, b.init());
            EXPECT_EQ(BRIDGE_STATE::CONNECTED, b.get_state());
            EXPECT_EQ(0u, b.get_root().count());
        }

        TEST(Bridge, ShutdownReleasesHostAndStore)
        {
            mem_kv_store kv;
            async::signal_target host;
            {
                bridge b(kv);
                ASSERT_EQ(0, b.init());
                b.attach_host(host);
                EXPECT_EQ(1u, host.listener_count());

                b.shutdown();
                EXPECT_EQ(BRIDGE_STATE::UNINITIALIZED, b.get_state());
                EXPECT_EQ(0u, host.listener_count());
                EXPECT_FALSE(kv.is_open());
                EXPECT_EQ(-1, b.save());

                // May be initialised again.
                EXPECT_EQ(0, b.init());
                b.attach_host(host);
            }

            // Destroyed bridge leaves no listener behind.
            EXPECT_EQ(0u, host.listener_count());
        }

        TEST(Bridge, StateNames)
        {
            EXPECT_STREQ("uninitialized", state_name(BRIDGE_STATE::UNINITIALIZED));
            EXPECT_STREQ("connected", state_name(BRIDGE_STATE::CONNECTED));
            EXPECT_STREQ("degraded", state_name(BRIDGE_STATE::DEGRADED));
            EXPECT_STREQ("loaded", state_name(BRIDGE_STATE::LOADED));
        }

    } // namespace
} // namespace treefs::persist
