#include "lp/export/FrameSnapshot.hpp"

#include <algorithm>
#include <cstdio>

namespace lp {

namespace {

// CRC-32 (ISO 3309), table built on first use.
const std::uint32_t* crcTable() {
  static const std::vector<std::uint32_t> table = [] {
    std::vector<std::uint32_t> t(256);
    for (std::uint32_t n = 0; n < 256; n++) {
      std::uint32_t c = n;
      for (int k = 0; k < 8; k++) {
        c = (c & 1) ? (0xEDB88320u ^ (c >> 1)) : (c >> 1);
      }
      t[n] = c;
    }
    return t;
  }();
  return table.data();
}

std::uint32_t crc32(const std::uint8_t* data, std::size_t len) {
  const std::uint32_t* table = crcTable();
  std::uint32_t c = 0xFFFFFFFFu;
  for (std::size_t i = 0; i < len; i++) {
    c = table[(c ^ data[i]) & 0xFF] ^ (c >> 8);
  }
  return c ^ 0xFFFFFFFFu;
}

std::uint32_t adler32(const std::vector<std::uint8_t>& data) {
  constexpr std::uint32_t kMod = 65521u;
  constexpr std::size_t kBlock = 5552; // largest run before the sums can overflow
  std::uint32_t a = 1, b = 0;
  std::size_t pos = 0;
  while (pos < data.size()) {
    std::size_t end = std::min(pos + kBlock, data.size());
    for (; pos < end; pos++) {
      a += data[pos];
      b += a;
    }
    a %= kMod;
    b %= kMod;
  }
  return (b << 16) | a;
}

void putBE32(std::vector<std::uint8_t>& out, std::uint32_t v) {
  out.push_back(static_cast<std::uint8_t>(v >> 24));
  out.push_back(static_cast<std::uint8_t>(v >> 16));
  out.push_back(static_cast<std::uint8_t>(v >> 8));
  out.push_back(static_cast<std::uint8_t>(v));
}

void appendChunk(std::vector<std::uint8_t>& png, const char* type,
                 const std::vector<std::uint8_t>& body) {
  putBE32(png, static_cast<std::uint32_t>(body.size()));
  std::size_t crcStart = png.size();
  png.insert(png.end(), type, type + 4);
  png.insert(png.end(), body.begin(), body.end());
  putBE32(png, crc32(&png[crcStart], png.size() - crcStart));
}

// Scanlines with filter byte 0 (None) in front of each row.
std::vector<std::uint8_t> scanlines(const Canvas& canvas) {
  const std::size_t rowBytes = static_cast<std::size_t>(canvas.width()) * 3;
  std::vector<std::uint8_t> raw;
  raw.reserve(static_cast<std::size_t>(canvas.height()) * (rowBytes + 1));
  const std::uint8_t* src = canvas.data();
  for (int y = 0; y < canvas.height(); y++) {
    raw.push_back(0x00);
    const std::uint8_t* row = src + static_cast<std::size_t>(y) * rowBytes;
    raw.insert(raw.end(), row, row + rowBytes);
  }
  return raw;
}

// zlib stream of uncompressed deflate blocks (max 65535 bytes each).
std::vector<std::uint8_t> zlibStored(const std::vector<std::uint8_t>& raw) {
  std::vector<std::uint8_t> z;
  z.reserve(raw.size() + raw.size() / 65535 * 5 + 16);
  z.push_back(0x78);
  z.push_back(0x01);

  std::size_t pos = 0;
  do {
    std::size_t n = std::min<std::size_t>(raw.size() - pos, 65535);
    bool last = (pos + n == raw.size());
    z.push_back(last ? 0x01 : 0x00);
    std::uint16_t len = static_cast<std::uint16_t>(n);
    std::uint16_t nlen = static_cast<std::uint16_t>(~len);
    z.push_back(static_cast<std::uint8_t>(len & 0xFF));
    z.push_back(static_cast<std::uint8_t>(len >> 8));
    z.push_back(static_cast<std::uint8_t>(nlen & 0xFF));
    z.push_back(static_cast<std::uint8_t>(nlen >> 8));
    z.insert(z.end(), raw.begin() + static_cast<std::ptrdiff_t>(pos),
             raw.begin() + static_cast<std::ptrdiff_t>(pos + n));
    pos += n;
  } while (pos < raw.size());

  putBE32(z, adler32(raw));
  return z;
}

bool writeFile(const std::string& path, const std::uint8_t* data, std::size_t len) {
  FILE* f = std::fopen(path.c_str(), "wb");
  if (!f) return false;
  std::size_t written = std::fwrite(data, 1, len, f);
  bool closed = (std::fclose(f) == 0);
  return written == len && closed;
}

} // anonymous namespace

std::vector<std::uint8_t> encodeCanvasPNG(const Canvas& canvas) {
  std::vector<std::uint8_t> png = {0x89, 'P', 'N', 'G', 0x0D, 0x0A, 0x1A, 0x0A};

  std::vector<std::uint8_t> ihdr;
  putBE32(ihdr, static_cast<std::uint32_t>(canvas.width()));
  putBE32(ihdr, static_cast<std::uint32_t>(canvas.height()));
  ihdr.push_back(8); // bit depth
  ihdr.push_back(2); // truecolor
  ihdr.push_back(0);
  ihdr.push_back(0);
  ihdr.push_back(0);
  appendChunk(png, "IHDR", ihdr);
  appendChunk(png, "IDAT", zlibStored(scanlines(canvas)));
  appendChunk(png, "IEND", {});
  return png;
}

bool writeCanvasPNG(const std::string& path, const Canvas& canvas) {
  if (canvas.width() <= 0 || canvas.height() <= 0) return false;
  auto png = encodeCanvasPNG(canvas);
  return writeFile(path, png.data(), png.size());
}

bool writeCanvasPPM(const std::string& path, const Canvas& canvas) {
  if (canvas.width() <= 0 || canvas.height() <= 0) return false;
  char header[32];
  int n = std::snprintf(header, sizeof(header), "P6\n%d %d\n255\n", canvas.width(), canvas.height());
  std::vector<std::uint8_t> out(header, header + n);
  out.insert(out.end(), canvas.data(), canvas.data() + canvas.sizeBytes());
  return writeFile(path, out.data(), out.size());
}

} // namespace lp
