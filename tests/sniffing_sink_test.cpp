#include <algorithm>
#include <cassert>
#include <string>
#include <vector>

#include "../common/errors.hpp"
#include "../common/file_io.hpp"
#include "../receiver/sniffing_sink.hpp"
#include "../sender/archive_packer.hpp"
#include "test_support.hpp"

namespace {

SniffingSink::Options Dest(const std::string& destination, bool overwrite = false) {
  SniffingSink::Options o;
  o.destination = destination;
  o.overwrite = overwrite;
  o.session_id = "abcd1234";
  return o;
}

void Feed(SniffingSink& sink, const std::vector<u8>& data, const std::string& name = "") {
  SinkInfo si;
  si.total_bytes = data.size();
  if (!name.empty()) si.name = name;
  sink.info(si);
  // Odd split so the 512-byte sniff window is crossed mid-write
  size_t first = std::min<size_t>(300, data.size());
  sink.write(data.data(), first);
  if (data.size() > first) sink.write(data.data() + first, data.size() - first);
  sink.close();
}

std::vector<u8> PackTree(const test::TempDir& tmp) {
  test::write_file(tmp / "src" / "one.txt", std::string("first"));
  test::write_file(tmp / "src" / "sub" / "two.bin", test::pattern(2000));
  ArchivePacker p({(tmp / "src").string()}, {});
  p.scan();
  std::vector<u8> out(p.total_size());
  size_t off = 0;
  for (size_t n; (n = p.read(out.data() + off, out.size() - off)) > 0;) off += n;
  assert(off == out.size());
  return out;
}

}  // namespace

int main() {
  test::quiet_logs();

  // Directory destination: raw payload named after the MetaHeader
  {
    test::TempDir tmp("sink-dir");
    auto payload = test::pattern(5000);
    SniffingSink sink(Dest(tmp.path().string()));
    Feed(sink, payload, "report.pdf");
    assert(sink.decision() == SniffingSink::Decision::RawFile);
    assert(test::read_file(tmp / "report.pdf") == payload);
    auto st = sink.stats();
    assert(st.started && st.written == payload.size());
    assert(st.announced && *st.announced == payload.size());
    assert(st.desired_name == "report.pdf");
    assert(st.resolved_path == (tmp / "report.pdf").string());

    // Same name again: a suffix is added, the first file is kept
    SniffingSink again(Dest(tmp.path().string()));
    Feed(again, test::text_bytes("second"), "report.pdf");
    assert(test::read_file(tmp / "report.pdf") == payload);
    assert(test::read_text(tmp / "report-1.pdf") == "second");

    // Overwrite replaces in place and the file is written anew
    std::string report = (tmp / "report.pdf").string();
    const u64 past = 1000000000ULL * 1000000ULL;
    file_io::apply_mtime(report, past);
    assert(file_io::mtime_ns_of(report) == past);
    SniffingSink over(Dest(tmp.path().string(), true));
    Feed(over, test::text_bytes("third"), "report.pdf");
    assert(test::read_text(tmp / "report.pdf") == "third");
    assert(file_io::mtime_ns_of(report) > past);
    assert(!fs::exists(tmp / "report-2.pdf"));
  }

  // Names from the wire are sanitised; no name falls back to the session
  {
    test::TempDir tmp("sink-names");
    SniffingSink evil(Dest(tmp.path().string()));
    Feed(evil, test::text_bytes("x"), "../../escape.sh");
    assert(test::read_text(tmp / "escape.sh") == "x");

    SniffingSink anon(Dest(tmp.path().string()));
    Feed(anon, test::text_bytes("y"));
    assert(test::read_text(tmp / "sascp-abcd1234.bin") == "y");

    // Two unnamed streams of one session do not clobber each other
    SniffingSink anon2(Dest(tmp.path().string()));
    Feed(anon2, test::text_bytes("w"));
    assert(test::read_text(tmp / "sascp-abcd1234.bin") == "y");
    assert(test::read_text(tmp / "sascp-abcd1234-1.bin") == "w");
    assert(anon2.stats().resolved_path == (tmp / "sascp-abcd1234-1.bin").string());
  }

  // Trailing slash: created on demand
  {
    test::TempDir tmp("sink-mkdir");
    std::string dest = (tmp / "new" / "place").string() + "/";
    SniffingSink sink(Dest(dest));
    Feed(sink, test::text_bytes("z"), "z.txt");
    assert(test::read_text(tmp / "new/place/z.txt") == "z");
  }

  // Concrete file destination ignores the MetaHeader name
  {
    test::TempDir tmp("sink-file");
    std::string dest = (tmp / "out.bin").string();
    auto payload = test::pattern(1500);
    SniffingSink sink(Dest(dest));
    Feed(sink, payload, "other-name.txt");
    assert(test::read_file(dest) == payload);
    assert(!fs::exists(tmp / "other-name.txt"));

    // Already there, no overwrite
    SniffingSink clash(Dest(dest));
    bool threw = false;
    try {
      Feed(clash, test::text_bytes("tiny"));
    } catch (const FileExistsError&) {
      threw = true;
    }
    assert(threw);
    assert(test::read_file(dest) == payload);

    SniffingSink replace(Dest(dest, true));
    Feed(replace, test::text_bytes("tiny"));
    assert(test::read_text(dest) == "tiny");
  }

  // Archive into a directory is extracted
  {
    test::TempDir tmp("sink-tar");
    auto tarball = PackTree(tmp);
    fs::path dest = tmp / "dest";
    fs::create_directories(dest);
    SniffingSink sink(Dest(dest.string()));
    Feed(sink, tarball, "src.tar");
    assert(sink.decision() == SniffingSink::Decision::Extract);
    assert(test::read_text(dest / "src/one.txt") == "first");
    assert(test::read_file(dest / "src/sub/two.bin") == test::pattern(2000));
    assert(!fs::exists(dest / "src.tar"));
    assert(sink.stats().written == tarball.size());
  }

  // Archive into a concrete file is stored as-is
  {
    test::TempDir tmp("sink-tar-file");
    auto tarball = PackTree(tmp);
    std::string dest = (tmp / "keep.tar").string();
    SniffingSink sink(Dest(dest));
    Feed(sink, tarball);
    assert(sink.decision() == SniffingSink::Decision::RawFile);
    assert(test::read_file(dest) == tarball);
  }

  // Archive to stdout is refused before anything is written
  {
    test::TempDir tmp("sink-tar-stdout");
    auto tarball = PackTree(tmp);
    SniffingSink sink(Dest("-"));
    bool threw = false;
    try {
      sink.write(tarball.data(), tarball.size());
    } catch (const InvalidInputError&) {
      threw = true;
    }
    assert(threw);
    assert(sink.written() == 0);
  }

  // Writes after close are an error
  {
    test::TempDir tmp("sink-closed");
    SniffingSink sink(Dest(tmp.path().string()));
    Feed(sink, test::text_bytes("a"), "a.txt");
    sink.close();   // idempotent
    bool threw = false;
    try {
      u8 b = 0;
      sink.write(&b, 1);
    } catch (const IoError&) {
      threw = true;
    }
    assert(threw);
  }

  // unique_path picks the first free suffix
  {
    test::TempDir tmp("sink-unique");
    assert(SniffingSink::unique_path(tmp.path(), "a.txt") == tmp / "a.txt");
    test::write_file(tmp / "a.txt", std::string("0"));
    test::write_file(tmp / "a-1.txt", std::string("1"));
    assert(SniffingSink::unique_path(tmp.path(), "a.txt") == tmp / "a-2.txt");
    test::write_file(tmp / ".env", std::string("0"));
    assert(SniffingSink::unique_path(tmp.path(), ".env") == tmp / ".env-1");
    test::write_file(tmp / "Makefile", std::string("0"));
    assert(SniffingSink::unique_path(tmp.path(), "Makefile") == tmp / "Makefile-1");
  }

  return 0;
}
