/**
 * @file transfer_packet.hpp
 * @brief Packet plus the mutable transport state needed while it is in
 *        flight (payload stream, cancellation, negotiated transfer info).
 */

#ifndef PEERLINK_TRANSFER_PACKET_HPP_
#define PEERLINK_TRANSFER_PACKET_HPP_

#include "peerlink/packet.hpp"
#include "peerlink/payload.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <utility>

namespace peerlink {

class TransferPacket {
 public:
  explicit TransferPacket(Packet packet,
                          std::shared_ptr<Payload> payload = nullptr)
      : packet_(std::move(packet)), payload_(std::move(payload)) {}

  ~TransferPacket() { ClosePayload(); }

  TransferPacket(const TransferPacket&) = delete;
  TransferPacket& operator=(const TransferPacket&) = delete;

  const Packet& packet() const noexcept { return packet_; }
  const std::string& Type() const noexcept { return packet_.Type(); }

  bool HasPayload() const noexcept {
    return packet_.HasPayload() && payload_ != nullptr;
  }
  int64_t PayloadSize() const noexcept { return packet_.PayloadSize(); }
  const std::shared_ptr<Payload>& payload() const noexcept { return payload_; }

  void SetPayload(std::shared_ptr<Payload> payload) {
    payload_ = std::move(payload);
  }

  void ClosePayload() noexcept {
    if (payload_ != nullptr) payload_->Close();
  }

  /**
   * @brief Move the payload out; the new owner is responsible for closing it.
   * Used when the stream outlives this object (asynchronous transfers).
   */
  std::shared_ptr<Payload> TakePayload() noexcept {
    return std::move(payload_);
  }

  void Cancel() noexcept { canceled_->store(true, std::memory_order_release); }
  bool IsCanceled() const noexcept {
    return canceled_->load(std::memory_order_acquire);
  }

  /** @brief Cancellation flag shared with background transfers. */
  std::shared_ptr<std::atomic<bool>> CancelFlag() const noexcept {
    return canceled_;
  }

  /** @brief Record transport-assigned transfer info (e.g. payload port). */
  void SetRuntimeTransferInfo(Json info) {
    std::lock_guard<std::mutex> lock(mutex_);
    runtime_info_ = std::move(info);
  }

  /** @brief Packet with runtime transfer info merged in, ready for the wire. */
  Packet ForWire() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!packet_.HasPayload() || runtime_info_.empty()) return packet_;
    Json merged = packet_.PayloadTransferInfo();
    merged.update(runtime_info_);
    return packet_.WithTransferInfo(std::move(merged));
  }

  std::string SerializeForWire() const { return Serialize(ForWire()); }

 private:
  Packet packet_;
  std::shared_ptr<Payload> payload_;
  std::shared_ptr<std::atomic<bool>> canceled_ =
      std::make_shared<std::atomic<bool>>(false);
  mutable std::mutex mutex_;
  Json runtime_info_ = Json::object();
};

}  // namespace peerlink

#endif  // PEERLINK_TRANSFER_PACKET_HPP_
