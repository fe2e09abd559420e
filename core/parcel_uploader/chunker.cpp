// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "chunker.hpp"

#include <stdexcept>
#include <string>

#include "upload_errors.hpp"

namespace parcel {
namespace uploader {

Chunker::Chunker(std::istream& input, uint64_t chunk_size, uint64_t min_chunk_size)
    : input_(input)
    , chunk_size_(chunk_size) {
  if (chunk_size == 0 || chunk_size < min_chunk_size) {
    throw std::invalid_argument(
      "Chunk size " + std::to_string(chunk_size) + " is below the minimum part size " +
      std::to_string(min_chunk_size)
    );
  }
  if (chunk_size > kMaxPartSize) {
    throw std::invalid_argument(
      "Chunk size " + std::to_string(chunk_size) + " exceeds the maximum part size " +
      std::to_string(kMaxPartSize)
    );
  }
}

std::optional<Chunk> Chunker::next() {
  if (exhausted_) {
    return std::nullopt;
  }

  Chunk chunk;
  chunk.data.resize(chunk_size_);
  input_.read(
    reinterpret_cast<char*>(chunk.data.data()), static_cast<std::streamsize>(chunk_size_)
  );
  const auto bytes_read = static_cast<uint64_t>(input_.gcount());

  if (input_.bad()) {
    exhausted_ = true;
    throw ChunkReadError(
      "I/O error reading source stream after " + std::to_string(bytes_consumed_ + bytes_read) +
      " bytes"
    );
  }
  chunk.data.resize(bytes_read);

  // A short read means EOF; a full read needs one byte of look-ahead
  bool at_end = bytes_read < chunk_size_;
  if (!at_end) {
    const auto next_byte = input_.peek();
    if (input_.bad()) {
      exhausted_ = true;
      throw ChunkReadError(
        "I/O error reading source stream after " + std::to_string(bytes_consumed_ + bytes_read) +
        " bytes"
      );
    }
    at_end = next_byte == std::istream::traits_type::eof();
  }

  chunk.is_final = at_end;
  exhausted_ = at_end;
  bytes_consumed_ += bytes_read;
  ++chunks_produced_;
  return chunk;
}

}  // namespace uploader
}  // namespace parcel
