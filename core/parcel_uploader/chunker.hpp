// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef PARCEL_CHUNKER_HPP
#define PARCEL_CHUNKER_HPP

#include <cstdint>
#include <istream>
#include <optional>
#include <vector>

#include "upload_types.hpp"

namespace parcel {
namespace uploader {

/**
 * A bounded slice of the source stream
 */
struct Chunk {
  std::vector<uint8_t> data;
  bool is_final = false;
};

/**
 * Splits a byte stream of unknown length into fixed-size chunks
 *
 * Every chunk but the last has exactly chunk_size bytes; the last one carries
 * the remainder and is flagged final. An empty stream yields a single empty
 * final chunk. The sequence is lazy and cannot be restarted.
 *
 * Usage:
 *   Chunker chunker(stream, 10 * 1024 * 1024);
 *   while (auto chunk = chunker.next()) {
 *     ...
 *   }
 */
class Chunker {
public:
  /**
   * @param input Source stream, drained by the chunker
   * @param chunk_size Size of every non-final chunk
   * @param min_chunk_size Lower bound for chunk_size (store minimum part size)
   * @throws std::invalid_argument if chunk_size is outside [min_chunk_size, kMaxPartSize]
   */
  Chunker(std::istream& input, uint64_t chunk_size, uint64_t min_chunk_size = kMinPartSize);

  // Non-copyable (holds a reference to the stream)
  Chunker(const Chunker&) = delete;
  Chunker& operator=(const Chunker&) = delete;

  /**
   * Read the next chunk
   *
   * @return The chunk, or std::nullopt once the final chunk was produced
   * @throws ChunkReadError on an I/O fault; no partial chunk is returned and
   *         the chunker is exhausted afterwards
   */
  std::optional<Chunk> next();

  /**
   * True once the final chunk was produced or reading failed
   */
  bool exhausted() const {
    return exhausted_;
  }

  uint64_t chunk_size() const {
    return chunk_size_;
  }

  uint64_t chunks_produced() const {
    return chunks_produced_;
  }

  uint64_t bytes_consumed() const {
    return bytes_consumed_;
  }

private:
  std::istream& input_;
  uint64_t chunk_size_;
  bool exhausted_ = false;
  uint64_t chunks_produced_ = 0;
  uint64_t bytes_consumed_ = 0;
};

}  // namespace uploader
}  // namespace parcel

#endif  // PARCEL_CHUNKER_HPP
