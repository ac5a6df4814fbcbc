// Copyright (c) 2024 liudegui. MIT License.
//
// peerlinkd: LAN device link daemon.
//   peerlinkd [config-file]
// Loads the local identity and trust store, announces itself over UDP and
// mDNS, and keeps TLS links to every peer it can reach. SIGINT/SIGTERM stop it.

#include "ping_plugin.hpp"

#include "peerlink/config.hpp"
#include "peerlink/file_util.hpp"
#include "peerlink/link_provider.hpp"
#include "peerlink/local_device.hpp"
#include "peerlink/log.hpp"
#include "peerlink/router.hpp"
#include "peerlink/shutdown.hpp"
#include "peerlink/task_pool.hpp"
#include "peerlink/trust_store.hpp"

#include <cstdlib>
#include <memory>
#include <string>
#include <unistd.h>

static constexpr const char* kDefaultConfigPath = "peerlinkd.json";

static std::string DefaultDataDir() {
  const char* home = std::getenv("HOME");
  if (home == nullptr || home[0] == '\0') return "peerlink-data";
  return peerlink::file::Join(home, ".local/share/peerlinkd");
}

static std::string DefaultDeviceName() {
  char host[256] = {};
  if (::gethostname(host, sizeof(host) - 1U) != 0 || host[0] == '\0') {
    return "peerlink";
  }
  return host;
}

static void StopProvider(int signo, void* ctx) {
  PEERLINK_LOG_INFO("main", "shutdown requested (signal %d)", signo);
  static_cast<peerlink::LinkProvider*>(ctx)->Stop();
}

static void SaveTrust(int /*signo*/, void* ctx) {
  auto r = static_cast<peerlink::TrustStore*>(ctx)->Save();
  if (!r.has_value()) {
    PEERLINK_LOG_WARN("main", "could not save trust store");
  }
}

int main(int argc, char* argv[]) {
  const char* config_path = (argc > 1) ? argv[1] : kDefaultConfigPath;

  peerlink::log::Init();

  peerlink::MultiConfig cfg;
  auto loaded = cfg.LoadFile(config_path);
  if (!loaded.has_value()) {
    if (argc > 1) {
      PEERLINK_LOG_ERROR("main", "cannot load %s (error %u)", config_path,
                         static_cast<unsigned>(loaded.get_error()));
      return 1;
    }
    PEERLINK_LOG_INFO("main", "no %s, using defaults", config_path);
  }

  peerlink::ProviderConfig pc = peerlink::ProviderConfig::FromStore(cfg);
  peerlink::log::SetLevel(peerlink::log::ParseLevel(
      pc.log_level.c_str(), peerlink::log::GetLevel()));
  if (pc.data_dir.empty()) pc.data_dir = DefaultDataDir();
  if (pc.device_name.empty()) pc.device_name = DefaultDeviceName();

  auto local = peerlink::LocalDevice::LoadOrCreate(pc.data_dir, pc.device_name,
                                                   pc.device_type);
  if (!local.has_value()) {
    PEERLINK_LOG_ERROR("main", "cannot load or create identity in %s",
                       pc.data_dir.c_str());
    return 1;
  }
  peerlink::LocalDevice device = std::move(local).value();
  PEERLINK_LOG_INFO("main", "device %s (%s), certificate %s",
                    device.Name().c_str(), device.Id().c_str(),
                    device.Cert().Sha256Fingerprint().c_str());

  peerlink::TrustStore trust(pc.data_dir);
  if (!trust.Load().has_value()) {
    PEERLINK_LOG_WARN("main", "trust store unreadable, starting empty");
  }

  peerlink::PacketRouter router;
  router.RegisterPlugin(std::make_unique<PingPlugin>());
  peerlink::Capabilities caps = router.GetCapabilities();
  device.SetCapabilities(caps.incoming, caps.outgoing);

  peerlink::TaskPool pool;
  peerlink::LinkProvider provider(device, trust, pool, pc);
  provider.AddReceiver(&router);

  peerlink::ShutdownManager shutdown;
  (void)shutdown.Register(&SaveTrust, &trust);
  (void)shutdown.Register(&StopProvider, &provider);
  if (!shutdown.InstallSignalHandlers().has_value()) {
    PEERLINK_LOG_ERROR("main", "cannot install signal handlers");
    return 1;
  }

  auto started = provider.Start();
  if (!started.has_value()) {
    PEERLINK_LOG_ERROR("main", "provider failed to start (error %u)",
                       static_cast<unsigned>(started.get_error()));
    return 1;
  }
  PEERLINK_LOG_INFO("main", "listening on TCP %u, UDP %u",
                    static_cast<unsigned>(provider.TcpPort()),
                    static_cast<unsigned>(pc.udp_port));

  shutdown.WaitForShutdown();
  provider.RemoveReceiver(&router);
  peerlink::log::Shutdown();
  return 0;
}
