/**
 * @file router.hpp
 * @brief Packet router: delivers inbound packets to plugins by type and
 *        routes outbound plugin packets onto the device's Link.
 *
 * Usage:
 *   peerlink::PacketRouter router;
 *   router.RegisterPlugin(std::make_unique<PingPlugin>());
 *   local.SetCapabilities(router.GetCapabilities().incoming,
 *                         router.GetCapabilities().outgoing);
 *   provider.AddReceiver(&router);
 */

#ifndef PEERLINK_ROUTER_HPP_
#define PEERLINK_ROUTER_HPP_

#include "peerlink/device_info.hpp"
#include "peerlink/link.hpp"
#include "peerlink/link_provider.hpp"
#include "peerlink/log.hpp"
#include "peerlink/packet.hpp"
#include "peerlink/transfer_packet.hpp"

#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace peerlink {

class PacketRouter;

// ============================================================================
// Plugin
// ============================================================================

/**
 * @brief Feature module bound to a set of packet types.
 *
 * Hooks run on link threads; implementations synchronize their own state.
 */
class Plugin {
 public:
  virtual ~Plugin() = default;

  virtual const char* Name() const = 0;
  /// Types this plugin consumes.
  virtual std::set<std::string> SupportedPacketTypes() const = 0;
  /// Types this plugin may send.
  virtual std::set<std::string> OutgoingPacketTypes() const = 0;

  /** @return true if the packet was handled. */
  virtual bool OnPacketReceived(const std::string& device_id,
                                TransferPacket& packet) = 0;

  virtual void OnDeviceConnected(const DeviceInfo& info) { (void)info; }
  virtual void OnDeviceDisconnected(const std::string& device_id) {
    (void)device_id;
  }

 protected:
  /// Send through the owning router; see PacketRouter::SendFromPlugin().
  bool Send(const std::string& device_id, TransferPacket& packet,
            const SendCallbacks& callbacks = {}, bool sync = true);

  PacketRouter* Router() const noexcept { return router_; }

 private:
  friend class PacketRouter;
  PacketRouter* router_ = nullptr;
};

/** @brief Capability sets advertised in the identity packet. */
struct Capabilities {
  std::set<std::string> incoming;
  std::set<std::string> outgoing;
};

// ============================================================================
// PacketRouter
// ============================================================================

class PacketRouter final : public ConnectionReceiver, public PacketReceiver {
 public:
  /// Handler for pair packets; returns whether the packet was handled.
  using PairHandlerFn = bool (*)(const DeviceInfo& from,
                                 TransferPacket& packet, void* ctx);

  PacketRouter() = default;

  ~PacketRouter() override {
    std::map<std::string, std::shared_ptr<Link>> links;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      links.swap(links_);
    }
    for (auto& kv : links) kv.second->RemoveReceiver(this);
  }

  PacketRouter(const PacketRouter&) = delete;
  PacketRouter& operator=(const PacketRouter&) = delete;

  /**
   * @brief Take ownership of @p plugin and index it by supported type.
   * @return The registered plugin, or nullptr if the name is taken.
   */
  Plugin* RegisterPlugin(std::unique_ptr<Plugin> plugin) {
    if (plugin == nullptr) return nullptr;
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& p : plugins_) {
      if (std::string(p->Name()) == plugin->Name()) {
        PEERLINK_LOG_WARN("router", "plugin %s already registered",
                          plugin->Name());
        return nullptr;
      }
    }
    plugin->router_ = this;
    Plugin* raw = plugin.get();
    for (const auto& type : raw->SupportedPacketTypes()) {
      by_type_[packet_type::Normalize(type)].push_back(raw);
    }
    plugins_.push_back(std::move(plugin));
    PEERLINK_LOG_DEBUG("router", "registered plugin %s", raw->Name());
    return raw;
  }

  void SetPairHandler(PairHandlerFn fn, void* ctx) {
    std::lock_guard<std::mutex> lock(mutex_);
    pair_fn_ = fn;
    pair_ctx_ = ctx;
  }

  /** @brief Union of all plugin types, for LocalDevice::SetCapabilities(). */
  Capabilities GetCapabilities() const {
    std::lock_guard<std::mutex> lock(mutex_);
    Capabilities caps;
    for (const auto& p : plugins_) {
      for (const auto& t : p->SupportedPacketTypes()) caps.incoming.insert(t);
      for (const auto& t : p->OutgoingPacketTypes()) caps.outgoing.insert(t);
    }
    return caps;
  }

  /**
   * @brief Send @p packet to @p device_id.
   * @return false with OnFailure(kNotConnected) if no Link exists, otherwise
   *         the Link's result.
   */
  bool SendPacket(const std::string& device_id, TransferPacket& packet,
                  const SendCallbacks& callbacks = {}, bool sync = true) {
    std::shared_ptr<Link> link = FindLink(device_id);
    if (link == nullptr) {
      PEERLINK_LOG_DEBUG("router", "no link to %s for %s", device_id.c_str(),
                         packet.Type().c_str());
      callbacks.Failure(LinkError::kNotConnected);
      return false;
    }
    return link->SendPacket(packet, callbacks, sync);
  }

  /**
   * @brief SendPacket() on behalf of @p plugin; refuses packet types not in
   *        the plugin's outgoing set.
   */
  bool SendFromPlugin(const Plugin& plugin, const std::string& device_id,
                      TransferPacket& packet,
                      const SendCallbacks& callbacks = {}, bool sync = true) {
    const std::string& type = packet.Type();
    std::set<std::string> allowed;
    for (const auto& t : plugin.OutgoingPacketTypes()) {
      allowed.insert(packet_type::Normalize(t));
    }
    if (allowed.count(type) == 0U) {
      PEERLINK_LOG_WARN("router", "plugin %s may not send %s", plugin.Name(),
                        type.c_str());
      return false;
    }
    return SendPacket(device_id, packet, callbacks, sync);
  }

  std::shared_ptr<Link> FindLink(const std::string& device_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = links_.find(device_id);
    return (it != links_.end()) ? it->second : nullptr;
  }

  std::vector<std::string> ConnectedDevices() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> ids;
    for (const auto& kv : links_) ids.push_back(kv.first);
    return ids;
  }

  size_t PluginCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return plugins_.size();
  }

  // ---------------------------------------------------------------- receivers

  void OnConnectionReceived(const std::shared_ptr<Link>& link) override {
    DeviceInfo info = link->Info();
    {
      std::lock_guard<std::mutex> lock(mutex_);
      links_[info.id] = link;
    }
    link->AddReceiver(this);
    PEERLINK_LOG_INFO("router", "device %s (%s) connected", info.name.c_str(),
                      info.id.c_str());
    for (Plugin* p : PluginsSnapshot()) p->OnDeviceConnected(info);
  }

  void OnConnectionLost(const std::shared_ptr<Link>& link) override {
    const std::string id = link->DeviceId();
    {
      std::lock_guard<std::mutex> lock(mutex_);
      auto it = links_.find(id);
      if (it == links_.end() || it->second != link) return;
      links_.erase(it);
    }
    link->RemoveReceiver(this);
    PEERLINK_LOG_INFO("router", "device %s disconnected", id.c_str());
    for (Plugin* p : PluginsSnapshot()) p->OnDeviceDisconnected(id);
  }

  void OnDeviceInfoUpdated(const DeviceInfo& info) override {
    PEERLINK_LOG_DEBUG("router", "device %s updated (protocol %d)",
                       info.id.c_str(), info.protocol_version);
  }

  bool OnPacketReceived(Link& link, TransferPacket& packet) override {
    const std::string& type = packet.Type();
    if (type == packet_type::kPair) {
      PairHandlerFn fn;
      void* ctx;
      {
        std::lock_guard<std::mutex> lock(mutex_);
        fn = pair_fn_;
        ctx = pair_ctx_;
      }
      if (fn != nullptr) return fn(link.Info(), packet, ctx);
    }

    std::vector<Plugin*> targets;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      auto it = by_type_.find(type);
      if (it != by_type_.end()) targets = it->second;
    }
    const std::string id = link.DeviceId();
    bool handled = false;
    for (Plugin* p : targets) {
      if (p->OnPacketReceived(id, packet)) handled = true;
    }
    if (!handled) {
      PEERLINK_LOG_DEBUG("router", "unhandled %s from %s", type.c_str(),
                         id.c_str());
    }
    return handled;
  }

 private:
  std::vector<Plugin*> PluginsSnapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Plugin*> out;
    out.reserve(plugins_.size());
    for (const auto& p : plugins_) out.push_back(p.get());
    return out;
  }

  mutable std::mutex mutex_;
  std::vector<std::unique_ptr<Plugin>> plugins_;
  std::map<std::string, std::vector<Plugin*>> by_type_;
  std::map<std::string, std::shared_ptr<Link>> links_;
  PairHandlerFn pair_fn_ = nullptr;
  void* pair_ctx_ = nullptr;
};

inline bool Plugin::Send(const std::string& device_id, TransferPacket& packet,
                         const SendCallbacks& callbacks, bool sync) {
  if (router_ == nullptr) {
    callbacks.Failure(LinkError::kNotConnected);
    return false;
  }
  return router_->SendFromPlugin(*this, device_id, packet, callbacks, sync);
}

}  // namespace peerlink

#endif  // PEERLINK_ROUTER_HPP_
