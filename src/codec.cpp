#include "chunkingest/codec.hpp"
#include "chunkingest/errors.hpp"
#include <boost/iostreams/device/array.hpp>
#include <boost/iostreams/device/back_inserter.hpp>
#include <boost/iostreams/filter/gzip.hpp>
#include <boost/iostreams/filtering_stream.hpp>
#include <cstdio>
#include <ios>
#include <openssl/evp.h>

namespace io = boost::iostreams;

namespace chunkingest {

namespace {

bool is_blank(const std::string &s) {
  for (char c : s) {
    if (c != ' ' && c != '\t' && c != '\r' && c != '\n')
      return false;
  }
  return true;
}

void open_source(io::filtering_istream &in, std::string_view data, bool gzip) {
  if (gzip)
    in.push(io::gzip_decompressor());
  in.push(io::array_source(data.data(), data.size()));
  // исключения потокового буфера (битый gzip) не глушим
  in.exceptions(std::ios::badbit);
}

} // namespace

std::string md5_hex(std::string_view data) {
  unsigned char md[EVP_MAX_MD_SIZE];
  unsigned int len = 0;
  if (EVP_Digest(data.data(), data.size(), md, &len, EVP_md5(), nullptr) != 1)
    throw Error("EVP_Digest(md5) failed");
  std::string hex;
  hex.reserve(len * 2);
  char buf[3];
  for (unsigned int i = 0; i < len; ++i) {
    std::snprintf(buf, sizeof(buf), "%02x", md[i]);
    hex += buf;
  }
  return hex;
}

std::string gzip_compress(std::string_view data) {
  std::string out;
  io::filtering_ostream os;
  os.push(io::gzip_compressor(io::gzip_params(io::gzip::default_compression)));
  os.push(io::back_inserter(out));
  os.write(data.data(), static_cast<std::streamsize>(data.size()));
  os.reset(); // закрывает цепочку, дописывает трейлер
  return out;
}

std::string gzip_decompress(std::string_view data, std::size_t max_bytes) {
  std::string out;
  try {
    io::filtering_istream in;
    open_source(in, data, true);
    char buf[64 * 1024];
    while (in) {
      in.read(buf, sizeof(buf));
      const auto n = static_cast<std::size_t>(in.gcount());
      if (out.size() + n > max_bytes)
        throw SizeLimitExceeded("decompressed payload exceeds " +
                                std::to_string(max_bytes) + " bytes");
      out.append(buf, n);
    }
  } catch (const std::ios_base::failure &e) {
    throw ParseError(std::string("invalid gzip stream: ") + e.what());
  }
  return out;
}

std::string encode_ndjson(const std::vector<RecordJson> &records) {
  std::string out;
  for (const auto &r : records) {
    out += r.dump();
    out += '\n';
  }
  return out;
}

std::vector<RecordJson> decode_ndjson(std::string_view body, bool gzip,
                                      std::size_t max_decoded_bytes) {
  std::vector<RecordJson> records;
  std::size_t decoded = 0;
  std::size_t line_no = 0;
  std::string pending; // хвост без '\n', не длиннее лимита

  auto take_line = [&](const std::string &line) {
    ++line_no;
    if (is_blank(line))
      return;
    RecordJson rec;
    try {
      rec = RecordJson::parse(line);
    } catch (const RecordJson::parse_error &e) {
      throw ParseError("invalid JSON at line " + std::to_string(line_no) +
                       ": " + e.what());
    }
    if (!rec.is_object())
      throw ParseError("line " + std::to_string(line_no) +
                       " is not a JSON object");
    records.push_back(std::move(rec));
  };

  try {
    io::filtering_istream in;
    open_source(in, body, gzip);
    char buf[64 * 1024];
    while (in) {
      in.read(buf, sizeof(buf));
      const auto n = static_cast<std::size_t>(in.gcount());
      decoded += n;
      if (decoded > max_decoded_bytes)
        throw SizeLimitExceeded("decoded NDJSON exceeds " +
                                std::to_string(max_decoded_bytes) + " bytes");
      std::size_t from = 0;
      for (std::size_t i = 0; i < n; ++i) {
        if (buf[i] != '\n')
          continue;
        pending.append(buf + from, i - from);
        take_line(pending);
        pending.clear();
        from = i + 1;
      }
      pending.append(buf + from, n - from);
    }
  } catch (const std::ios_base::failure &e) {
    throw ParseError("invalid gzip stream after line " +
                     std::to_string(line_no) + ": " + e.what());
  }
  if (!pending.empty())
    take_line(pending);
  return records;
}

} // namespace chunkingest
