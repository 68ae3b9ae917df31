#include "bench_main.hpp"

#include "asn1/der/reader.hpp"
#include "asn1/utils/value_dump.hpp"

#include <cstdint>
#include <string>
#include <vector>

using namespace asn1;
using namespace asn1::der;

namespace {

// 追加一个 TLV（长度按最简形式编码）。
void append_tlv(std::vector<byte> &out, byte t, const std::vector<byte> &content) {
  out.push_back(t);
  const auto n = content.size();
  if (n <= kMaxShortFormLength) {
    out.push_back(static_cast<byte>(n));
  } else {
    std::vector<byte> len;
    for (auto v = n; v != 0; v >>= 8) {
      len.insert(len.begin(), static_cast<byte>(v & 0xFFu));
    }
    out.push_back(static_cast<byte>(kLongFormFlag | len.size()));
    out.insert(out.end(), len.begin(), len.end());
  }
  out.insert(out.end(), content.begin(), content.end());
}

// 证书 Name 形状的数据：SEQUENCE OF SET { SEQUENCE { OID, PrintableString } }
std::vector<byte> make_name_list(std::size_t count) {
  const std::vector<byte> oid_cn{0x55, 0x04, 0x03};
  std::vector<byte> body;
  for (std::size_t i = 0; i < count; ++i) {
    const auto text = "Example Node " + std::to_string(i);
    std::vector<byte> atv;
    append_tlv(atv, static_cast<byte>(tag::object_identifier), oid_cn);
    append_tlv(atv, static_cast<byte>(tag::printable_string), std::vector<byte>(text.begin(), text.end()));
    std::vector<byte> seq;
    append_tlv(seq, static_cast<byte>(tag::sequence), atv);
    append_tlv(body, static_cast<byte>(tag::set), seq);
  }
  std::vector<byte> out;
  append_tlv(out, static_cast<byte>(tag::sequence), body);
  return out;
}

std::vector<byte> make_deep_nesting(std::size_t depth) {
  std::vector<byte> inner{static_cast<byte>(tag::null), 0x00};
  for (std::size_t i = 0; i < depth; ++i) {
    std::vector<byte> wrapped;
    append_tlv(wrapped, static_cast<byte>(tag::sequence), inner);
    inner.swap(wrapped);
  }
  return inner;
}

std::size_t walk(const std::vector<byte> &in, ReaderOptions options = {}) {
  Reader r(bytes_view{in.data(), in.size()}, options);
  Value v;
  std::size_t count = 0;
  while (!r.next(v)) {
    ++count;
  }
  return count;
}

void bench_reader_name_list() {
  constexpr std::size_t count = 10000;
  const auto doc = make_name_list(count);
  std::size_t values = 0;

  BENCH_RUN("DER: walk name list (10000 RDNs)", doc.size(), 5, { values = walk(doc); });
  if (values != 1 + count * 6 + 1) {
    std::cerr << "unexpected value count: " << values << "\n";
  }
}

void bench_reader_deep_nesting() {
  constexpr std::size_t depth = 1000;
  const auto doc = make_deep_nesting(depth);
  std::size_t values = 0;

  BENCH_RUN("DER: walk deep nesting (1000 levels)", doc.size(), 5, {
    values = walk(doc, ReaderOptions{0});
  });
  if (values != depth * 2 + 1) {
    std::cerr << "unexpected value count: " << values << "\n";
  }
}

void bench_object_identifier_digits() {
  const std::vector<byte> oid_bytes{0x2A, 0x86, 0x48, 0x86, 0xF7, 0x0D, 0x01, 0x01, 0x0B};
  constexpr int rounds = 100000;
  std::uint64_t sum = 0;

  BENCH_RUN("DER: OID parse + digits (100000x)", oid_bytes.size() * rounds, 3, {
    for (int i = 0; i < rounds; ++i) {
      ObjectIdentifier oid;
      if (ObjectIdentifier::parse(bytes_view{oid_bytes.data(), oid_bytes.size()}, oid)) {
        break;
      }
      for (auto d : oid.digits()) {
        sum += d;
      }
    }
  });
  if (sum == 0) {
    std::cerr << "oid decode produced no digits\n";
  }
}

void bench_value_dump() {
  const auto doc = make_name_list(1000);
  std::string out;

  BENCH_RUN("DER: dump_values name list (1000 RDNs)", doc.size(), 3, {
    auto ec = utils::dump_values(bytes_view{doc.data(), doc.size()}, out);
    if (ec) {
      std::cerr << "dump failed: " << ec.message() << "\n";
    }
  });
}

}  // namespace

int main() {
  bench_reader_name_list();
  bench_reader_deep_nesting();
  bench_object_identifier_digits();
  bench_value_dump();
  asn1::benchmarks::print_results();
  return 0;
}
