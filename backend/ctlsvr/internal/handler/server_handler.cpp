#include "server_handler.h"
#include "../service/node_stats.h"

namespace keyward::ctl {

ServerHandler::ServerHandler(std::shared_ptr<NodeStats> stats)
    : stats_(std::move(stats)) {}

MemStatsReply ServerHandler::MemStats() {
  MemStatsReply reply;
  reply.memstats = stats_->CollectMemStats();
  return reply;
}

SysInfoReply ServerHandler::SysInfo() {
  SysInfoReply reply;
  reply.info = stats_->CollectSysInfo();
  return reply;
}

} // namespace keyward::ctl
