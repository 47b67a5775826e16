#include <gtest/gtest.h>
#include <string.h>
#include <memory>
#include "../src/codec/tree_codec.hpp"
#include "../src/util.hpp"

namespace treefs::codec
{
    namespace
    {
        void build_sample(fs::directory &root)
        {
            ASSERT_TRUE(root.add_entry(std::make_unique<fs::file>("a.txt", std::string_view("hello"))));
            ASSERT_TRUE(root.add_entry(std::make_unique<fs::directory>("sub")));
            fs::directory *sub = root.get_dir("sub");
            ASSERT_TRUE(sub->add_entry(std::make_unique<fs::file>("b.bin", std::vector<uint8_t>{0, 255, 3})));
            ASSERT_TRUE(sub->add_entry(std::make_unique<fs::directory>("empty")));
            ASSERT_TRUE(root.add_entry(std::make_unique<fs::file>("c.txt", std::string_view("four")), "alias"));
        }

        void append_u32(std::vector<uint8_t> &buf, const uint32_t n)
        {
            uint8_t b[4];
            util::uint32_to_bytes(b, n);
            buf.insert(buf.end(), b, b + 4);
        }

        void append_u64(std::vector<uint8_t> &buf, const uint64_t n)
        {
            uint8_t b[8];
            util::uint64_to_bytes(b, n);
            buf.insert(buf.end(), b, b + 8);
        }

        void append_str(std::vector<uint8_t> &buf, std::string_view s)
        {
            append_u32(buf, s.size());
            buf.insert(buf.end(), s.begin(), s.end());
        }

        void append_entry_head(std::vector<uint8_t> &buf, const fs::ENTRY_KIND kind, std::string_view name)
        {
            buf.push_back(static_cast<uint8_t>(kind));
            append_str(buf, name);
        }

        // Builds a record with a valid header around a hand made body.
        std::vector<uint8_t> seal(const std::vector<uint8_t> &body)
        {
            fs::directory empty("/");
            std::vector<uint8_t> record;
            EXPECT_EQ(0, encode(record, empty));
            record.resize(RECORD_HEADER_LEN);
            record.insert(record.end(), body.begin(), body.end());

            hasher::h32 hash;
            hasher::hash_buf(hash, body.data(), body.size());
            memcpy(record.data() + RECORD_HEADER_LEN - sizeof(hasher::h32), &hash, sizeof(hasher::h32));
            return record;
        }

        TEST(TreeCodec, RoundTrip)
        {
            fs::directory root("/");
            build_sample(root);

            std::vector<uint8_t> record;
            ASSERT_EQ(0, encode(record, root));

            std::unique_ptr<fs::directory> decoded;
            ASSERT_EQ(0, decode(decoded, record.data(), record.size()));
            ASSERT_NE(nullptr, decoded);

            EXPECT_EQ("/", decoded->get_name());
            EXPECT_EQ(std::vector<std::string>({"a.txt", "sub", "alias"}), decoded->get_entry_names());
            EXPECT_EQ(root.size(), decoded->size());
            EXPECT_EQ("hello", decoded->get_file("a.txt")->get_text());
            EXPECT_EQ(std::vector<uint8_t>({0, 255, 3}), decoded->get_dir("sub")->get_file("b.bin")->get_content());
            EXPECT_EQ(0u, decoded->get_dir("sub")->get_dir("empty")->count());

            // Key and entry name are both kept.
            EXPECT_EQ("c.txt", decoded->get_entry("alias")->get_name());

            const std::vector<fs::file *> orig_files = root.get_files();
            const std::vector<fs::file *> files = decoded->get_files();
            ASSERT_EQ(orig_files.size(), files.size());
            for (size_t i = 0; i < files.size(); i++)
            {
                EXPECT_EQ(orig_files[i]->path(), files[i]->path());
            }

            // Encoding the decoded tree gives identical bytes.
            std::vector<uint8_t> record2;
            ASSERT_EQ(0, encode(record2, *decoded));
            EXPECT_EQ(record, record2);
        }

        TEST(TreeCodec, Header)
        {
            fs::directory root("/");
            build_sample(root);

            std::vector<uint8_t> record;
            ASSERT_EQ(0, encode(record, root));
            EXPECT_EQ(0, memcmp(record.data() + version::VERSION_BYTES_LEN, RECORD_MAGIC, RECORD_MAGIC_LEN));

            record_info info;
            ASSERT_EQ(0, read_header(info, record.data(), record.size()));
            EXPECT_EQ(version::TREEFS_VERSION, info.treefs_version);
            EXPECT_EQ(RECORD_FORMAT_VERSION, info.format_version);
            EXPECT_EQ(record.size() - RECORD_HEADER_LEN, info.body_len);
        }

        TEST(TreeCodec, HeaderVersionWithoutVersionInit)
        {
            // Version bytes as they are before version::init() runs.
            memset(version::TREEFS_VERSION_BYTES, 0, version::VERSION_BYTES_LEN);

            fs::directory root("/");
            std::vector<uint8_t> record;
            const int res = encode(record, root);
            ASSERT_EQ(0, version::init());
            ASSERT_EQ(0, res);

            record_info info;
            ASSERT_EQ(0, read_header(info, record.data(), record.size()));
            EXPECT_EQ(version::TREEFS_VERSION, info.treefs_version);
            EXPECT_NE("0.0.0", info.treefs_version);
        }

        TEST(TreeCodec, EmptyTree)
        {
            fs::directory root("/");
            std::vector<uint8_t> record;
            ASSERT_EQ(0, encode(record, root));

            std::unique_ptr<fs::directory> decoded;
            ASSERT_EQ(0, decode(decoded, record.data(), record.size()));
            EXPECT_EQ(0u, decoded->count());
        }

        TEST(TreeCodec, RejectsCorruptedBody)
        {
            fs::directory root("/");
            build_sample(root);
            std::vector<uint8_t> record;
            ASSERT_EQ(0, encode(record, root));

            record[record.size() - 1] ^= 0xff;

            std::unique_ptr<fs::directory> decoded;
            EXPECT_EQ(-1, decode(decoded, record.data(), record.size()));
            EXPECT_EQ(nullptr, decoded);
        }

        TEST(TreeCodec, RejectsBadMagic)
        {
            fs::directory root("/");
            std::vector<uint8_t> record;
            ASSERT_EQ(0, encode(record, root));
            record[version::VERSION_BYTES_LEN] = 'X';

            std::unique_ptr<fs::directory> decoded;
            EXPECT_EQ(-1, decode(decoded, record.data(), record.size()));
        }

        TEST(TreeCodec, RejectsUnknownFormatVersion)
        {
            fs::directory root("/");
            std::vector<uint8_t> record;
            ASSERT_EQ(0, encode(record, root));
            util::uint16_to_bytes(record.data() + version::VERSION_BYTES_LEN + RECORD_MAGIC_LEN, RECORD_FORMAT_VERSION + 1);

            std::unique_ptr<fs::directory> decoded;
            EXPECT_EQ(-1, decode(decoded, record.data(), record.size()));
        }

        TEST(TreeCodec, RejectsTruncated)
        {
            fs::directory root("/");
            build_sample(root);
            std::vector<uint8_t> record;
            ASSERT_EQ(0, encode(record, root));

            std::unique_ptr<fs::directory> decoded;
            EXPECT_EQ(-1, decode(decoded, record.data(), RECORD_HEADER_LEN - 1));
            EXPECT_EQ(-1, decode(decoded, record.data(), 0));

            // Truncated body with a matching hash.
            const std::vector<uint8_t> body(record.begin() + RECORD_HEADER_LEN, record.end() - 2);
            const std::vector<uint8_t> sealed = seal(body);
            EXPECT_EQ(-1, decode(decoded, sealed.data(), sealed.size()));
            EXPECT_EQ(nullptr, decoded);
        }

        TEST(TreeCodec, HandMadeBodyDecodes)
        {
            std::vector<uint8_t> body;
            append_entry_head(body, fs::ENTRY_KIND::DIR, "/");
            append_u32(body, 1);
            append_str(body, "k");
            append_entry_head(body, fs::ENTRY_KIND::FILE, "f");
            append_u64(body, 2);
            body.push_back('o');
            body.push_back('k');

            const std::vector<uint8_t> record = seal(body);
            std::unique_ptr<fs::directory> decoded;
            ASSERT_EQ(0, decode(decoded, record.data(), record.size()));
            EXPECT_EQ("ok", decoded->get_file("k")->get_text());
            EXPECT_EQ("f", decoded->get_file("k")->get_name());
        }

        TEST(TreeCodec, RejectsFileRoot)
        {
            std::vector<uint8_t> body;
            append_entry_head(body, fs::ENTRY_KIND::FILE, "f");
            append_u64(body, 0);

            const std::vector<uint8_t> record = seal(body);
            std::unique_ptr<fs::directory> decoded;
            EXPECT_EQ(-1, decode(decoded, record.data(), record.size()));
        }

        TEST(TreeCodec, RejectsTrailingBytes)
        {
            std::vector<uint8_t> body;
            append_entry_head(body, fs::ENTRY_KIND::DIR, "/");
            append_u32(body, 0);
            body.push_back(0);

            const std::vector<uint8_t> record = seal(body);
            std::unique_ptr<fs::directory> decoded;
            EXPECT_EQ(-1, decode(decoded, record.data(), record.size()));
        }

        TEST(TreeCodec, RejectsUnknownKind)
        {
            std::vector<uint8_t> body;
            append_entry_head(body, fs::ENTRY_KIND::DIR, "/");
            append_u32(body, 1);
            append_str(body, "x");
            body.push_back(7);
            append_str(body, "x");

            const std::vector<uint8_t> record = seal(body);
            std::unique_ptr<fs::directory> decoded;
            EXPECT_EQ(-1, decode(decoded, record.data(), record.size()));
        }

        TEST(TreeCodec, RejectsDuplicateKeys)
        {
            std::vector<uint8_t> body;
            append_entry_head(body, fs::ENTRY_KIND::DIR, "/");
            append_u32(body, 2);
            for (int i = 0; i < 2; i++)
            {
                append_str(body, "same");
                append_entry_head(body, fs::ENTRY_KIND::DIR, "same");
                append_u32(body, 0);
            }

            const std::vector<uint8_t> record = seal(body);
            std::unique_ptr<fs::directory> decoded;
            EXPECT_EQ(-1, decode(decoded, record.data(), record.size()));
        }

        TEST(TreeCodec, RejectsOversizedLengths)
        {
            std::vector<uint8_t> body;
            append_entry_head(body, fs::ENTRY_KIND::DIR, "/");
            append_u32(body, 1);
            append_str(body, "f");
            append_entry_head(body, fs::ENTRY_KIND::FILE, "f");
            append_u64(body, UINT64_MAX);

            const std::vector<uint8_t> record = seal(body);
            std::unique_ptr<fs::directory> decoded;
            EXPECT_EQ(-1, decode(decoded, record.data(), record.size()));
        }

        TEST(TreeCodec, RejectsExcessiveNesting)
        {
            const uint32_t levels = MAX_DECODE_DEPTH + 2;
            std::vector<uint8_t> body;
            for (uint32_t i = 0; i < levels; i++)
            {
                append_entry_head(body, fs::ENTRY_KIND::DIR, "d");
                append_u32(body, i + 1 < levels ? 1 : 0);
                if (i + 1 < levels)
                    append_str(body, "d");
            }

            const std::vector<uint8_t> record = seal(body);
            std::unique_ptr<fs::directory> decoded;
            EXPECT_EQ(-1, decode(decoded, record.data(), record.size()));
        }

    } // namespace
} // namespace treefs::codec
