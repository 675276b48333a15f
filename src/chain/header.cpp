// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "chain/header.hpp"
#include "util/hash.hpp"
#include "util/string_parsing.hpp"
#include <algorithm>
#include <sstream>
#include <vector>

namespace bridgerelay {
namespace chain {

namespace {

void WriteBE64(uint8_t *ptr, uint64_t value) {
  for (int i = 7; i >= 0; --i) {
    ptr[i] = static_cast<uint8_t>(value & 0xff);
    value >>= 8;
  }
}

constexpr char kFieldSeparator = '|';
constexpr size_t kFieldCount = 5;

} // namespace

Header::CommitmentBytes Header::SerializeCommitment() const noexcept {
  CommitmentBytes data{};

  WriteBE64(data.data() + OFF_NUMBER, number);
  WriteBE64(data.data() + OFF_TIME, timestamp);
  std::copy(prevHeaderHash.begin(), prevHeaderHash.end(),
            data.begin() + OFF_PREV);
  std::copy(txRoot.begin(), txRoot.end(), data.begin() + OFF_TX);
  std::copy(receiptsRoot.begin(), receiptsRoot.end(),
            data.begin() + OFF_RECEIPTS);

  return data;
}

uint256 Header::GetCommitmentHash() const {
  const auto s = SerializeCommitment();
  return util::Sha256(s);
}

std::string Header::EncodeRecord() const {
  std::string out;
  out.reserve(3 * 66 + 40);
  out += std::to_string(number);
  out += kFieldSeparator;
  out += std::to_string(timestamp);
  out += kFieldSeparator;
  out += prevHeaderHash.ToString();
  out += kFieldSeparator;
  out += txRoot.ToString();
  out += kFieldSeparator;
  out += receiptsRoot.ToString();
  return out;
}

std::optional<Header> Header::DecodeRecord(std::string_view record) {
  std::vector<std::string> fields;
  size_t start = 0;
  while (true) {
    size_t pos = record.find(kFieldSeparator, start);
    if (pos == std::string_view::npos) {
      fields.emplace_back(record.substr(start));
      break;
    }
    fields.emplace_back(record.substr(start, pos - start));
    start = pos + 1;
  }
  if (fields.size() != kFieldCount) {
    return std::nullopt;
  }

  auto number = util::SafeParseUint64(fields[0]);
  auto timestamp = util::SafeParseUint64(fields[1]);
  auto prev = util::SafeParseHash(fields[2]);
  auto tx = util::SafeParseHash(fields[3]);
  auto receipts = util::SafeParseHash(fields[4]);
  if (!number || !timestamp || !prev || !tx || !receipts) {
    return std::nullopt;
  }

  Header h;
  h.number = *number;
  h.timestamp = *timestamp;
  h.prevHeaderHash = *prev;
  h.txRoot = *tx;
  h.receiptsRoot = *receipts;
  return h;
}

std::string Header::ToString() const {
  std::stringstream s;
  s << "Header(\n";
  s << "  number=" << number << "\n";
  s << "  timestamp=" << timestamp << "\n";
  s << "  prevHeaderHash=" << prevHeaderHash.ToString() << "\n";
  s << "  txRoot=" << txRoot.ToString() << "\n";
  s << "  receiptsRoot=" << receiptsRoot.ToString() << "\n";
  s << ")\n";
  return s.str();
}

} // namespace chain
} // namespace bridgerelay
