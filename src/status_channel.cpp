#include "status_channel.hpp"

void send_sync_status(const SyncSender& sender, SyncStatus status) {
  static_cast<void>(sender.send(SyncMessage(std::move(status))));
}

void send_sync_event(const SyncSender& sender, SyncEvent event) {
  static_cast<void>(sender.send(SyncMessage(std::move(event))));
}
