#include <algorithm>
#include <cassert>
#include <cstring>
#include <string>
#include <vector>

#include "../common/errors.hpp"
#include "../common/tar_format.hpp"
#include "../receiver/archive_extractor.hpp"
#include "test_support.hpp"

namespace {

// One ustar header block, checksum sealed
std::vector<u8> Header(const std::string& name, u64 size, char type = tar::TYPE_FILE,
                       u32 mode = 0644) {
  std::vector<u8> h(tar::BLOCK, 0);
  std::memcpy(h.data() + tar::OFF_NAME, name.data(), std::min(name.size(), tar::LEN_NAME));
  tar::put_number(h.data() + tar::OFF_MODE, tar::LEN_MODE, mode);
  tar::put_number(h.data() + tar::OFF_UID, tar::LEN_UID, 0);
  tar::put_number(h.data() + tar::OFF_GID, tar::LEN_GID, 0);
  tar::put_number(h.data() + tar::OFF_SIZE, tar::LEN_SIZE, size);
  tar::put_number(h.data() + tar::OFF_MTIME, tar::LEN_MTIME, 1700000000);
  h[tar::OFF_TYPE] = (u8)type;
  std::memcpy(h.data() + tar::OFF_MAGIC, "ustar", 6);
  std::memcpy(h.data() + tar::OFF_VERSION, "00", 2);
  tar::seal(h.data());
  return h;
}

void Append(std::vector<u8>& tar_bytes, const std::string& name, const std::string& body,
            char type = tar::TYPE_FILE) {
  auto h = Header(name, body.size(), type);
  tar_bytes.insert(tar_bytes.end(), h.begin(), h.end());
  tar_bytes.insert(tar_bytes.end(), body.begin(), body.end());
  tar_bytes.resize(tar_bytes.size() + (tar::round_up(body.size()) - body.size()), 0);
}

void End(std::vector<u8>& tar_bytes) {
  tar_bytes.resize(tar_bytes.size() + 2 * tar::BLOCK, 0);
}

template <class E>
bool Throws(ArchiveExtractor& x, const std::vector<u8>& bytes, bool finish = false) {
  try {
    x.feed(bytes.data(), bytes.size());
    if (finish) x.finish();
  } catch (const E&) {
    return true;
  }
  return false;
}

}  // namespace

int main() {
  test::quiet_logs();

  // Hostile names never land outside the root
  {
    test::TempDir tmp("extract-unsafe");
    fs::path root = tmp / "root";
    fs::path outside = tmp / "outside";
    fs::create_directories(root);
    fs::create_directories(outside);
    fs::create_symlink(outside, root / "link");

    std::vector<u8> t;
    Append(t, "../../etc/passwd", "root:x:0:0\n");
    Append(t, "..", "nothing left after normalising");
    Append(t, "link/evil.txt", "through a symlink");
    Append(t, "ok.txt", "fine");
    End(t);

    ArchiveExtractor x(root, false);
    x.feed(t.data(), t.size());
    x.finish();

    assert(x.ended());
    assert(x.files_extracted() == 2);
    assert(x.entries_skipped() == 2);
    assert(test::read_text(root / "ok.txt") == "fine");
    // ".." segments are popped, so this stays under the root
    assert(test::read_text(root / "etc" / "passwd") == "root:x:0:0\n");
    assert(!fs::exists(tmp / "etc"));
    assert(!fs::exists(outside / "evil.txt"));
  }

  // Existing files are not replaced unless asked
  {
    test::TempDir tmp("extract-exists");
    test::write_file(tmp / "a.txt", std::string("old"));
    std::vector<u8> t;
    Append(t, "a.txt", "new");
    End(t);

    ArchiveExtractor keep(tmp.path(), false);
    bool threw = false;
    try {
      keep.feed(t.data(), t.size());
    } catch (const FileExistsError& e) {
      threw = e.path().find("a.txt") != std::string::npos;
    }
    assert(threw);
    assert(test::read_text(tmp / "a.txt") == "old");

    ArchiveExtractor replace(tmp.path(), true);
    replace.feed(t.data(), t.size());
    replace.finish();
    assert(test::read_text(tmp / "a.txt") == "new");
  }

  // Directories, skipped link types, GNU long names, modes and mtimes
  {
    test::TempDir tmp("extract-types");
    std::vector<u8> t;
    auto d = Header("docs/", 0, tar::TYPE_DIR, 0755);
    t.insert(t.end(), d.begin(), d.end());
    Append(t, "docs/link", "", tar::TYPE_SYMLINK);
    std::string long_name = "docs/" + std::string(150, 'n') + ".txt";
    Append(t, "././@LongLink", long_name + '\0', tar::TYPE_GNU_LONG);
    Append(t, "ignored-short-name", "long body");
    auto x_hdr = Header("docs/run.sh", 3, tar::TYPE_FILE, 0755);
    t.insert(t.end(), x_hdr.begin(), x_hdr.end());
    t.insert(t.end(), {'l', 's', '\n'});
    t.resize(t.size() + tar::BLOCK - 3, 0);
    End(t);

    ArchiveExtractor x(tmp.path(), false);
    x.feed(t.data(), t.size());
    x.finish();
    assert(x.dirs_created() == 1);
    assert(x.entries_skipped() == 1);
    assert(x.files_extracted() == 2);
    assert(!fs::exists(tmp / "docs/link"));
    assert(!fs::exists(tmp / "ignored-short-name"));
    assert(test::read_text(tmp.path() / long_name) == "long body");

    auto perms = fs::status(tmp / "docs/run.sh").permissions();
    assert((perms & fs::perms::owner_exec) != fs::perms::none);
    assert(file_io::mtime_ns_of((tmp / "docs/run.sh").string()) == 1700000000ULL * 1000000000ULL);
  }

  // PAX path record
  {
    test::TempDir tmp("extract-pax");
    std::vector<u8> t;
    Append(t, "PaxHeaders/x", "22 path=pax/named.txt\n", tar::TYPE_PAX);
    Append(t, "short", "pax body");
    End(t);
    ArchiveExtractor x(tmp.path(), false);
    x.feed(t.data(), t.size());
    x.finish();
    assert(test::read_text(tmp / "pax/named.txt") == "pax body");
  }

  // Corrupt header
  {
    test::TempDir tmp("extract-corrupt");
    std::vector<u8> t;
    Append(t, "a.txt", "data");
    t[10] ^= 0x20;
    ArchiveExtractor x(tmp.path(), false);
    assert(Throws<ProtocolError>(x, t));
  }

  // Stream cut inside an entry
  {
    test::TempDir tmp("extract-trunc");
    std::vector<u8> t;
    Append(t, "big.bin", std::string(2000, 'b'));
    t.resize(tar::BLOCK + 700);
    ArchiveExtractor x(tmp.path(), false);
    assert(Throws<ProtocolError>(x, t, true));
  }

  // Missing end marker at an entry boundary is tolerated
  {
    test::TempDir tmp("extract-noend");
    std::vector<u8> t;
    Append(t, "a.txt", "abc");
    ArchiveExtractor x(tmp.path(), false);
    x.feed(t.data(), t.size());
    x.finish();
    assert(!x.ended());
    assert(x.files_extracted() == 1);
  }

  // Bytes after the end marker are ignored
  {
    test::TempDir tmp("extract-trailer");
    std::vector<u8> t;
    Append(t, "a.txt", "abc");
    End(t);
    t.resize(t.size() + 10 * tar::BLOCK, 0x55);
    ArchiveExtractor x(tmp.path(), false);
    x.feed(t.data(), t.size());
    x.finish();
    assert(x.ended() && x.files_extracted() == 1);
  }

  return 0;
}
