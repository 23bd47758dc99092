#pragma once

#include <link_supervisor/event_journal.hpp>
#include <link_supervisor/link_supervisor.hpp>
#include <link_supervisor/posix_process_launcher.hpp>

#include <joylink/msg/link_status.hpp>
#include <joylink/msg/vehicle_status.hpp>
#include <rclcpp/rclcpp.hpp>

#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace link_supervisor
{

/**
 * Keeps the MAVLink relay process alive. A wall timer at check_rate_hz drives
 * LinkSupervisor::step(); every record it returns is logged (and mirrored to the
 * journal in debug mode), and LinkStatus is published on each wake.
 *
 * Throws std::invalid_argument from the constructor on bad parameters.
 */
class LinkSupervisorNode : public rclcpp::Node
{
public:
  explicit LinkSupervisorNode(const rclcpp::NodeOptions & options = rclcpp::NodeOptions());
  ~LinkSupervisorNode() override;

  /// Stops restarts and terminates the relay within terminate_grace_s.
  void shutdown();

private:
  void onTimer();
  void onVehicleStatus(const joylink::msg::VehicleStatus::SharedPtr msg);

  void checkLiveness(LinkSupervisor::Clock::time_point now);
  void handleRecords(const std::vector<SupervisorRecord> & records);
  void publishStatus(LinkSupervisor::Clock::time_point now);

  SupervisorConfig readSupervisorConfig();
  LinkCommandConfig readCommandConfig();
  void openJournal(bool debug, const std::string & logFile);

  PosixProcessLauncher launcher_;
  std::unique_ptr<LinkSupervisor> supervisor_;
  EventJournal journal_;
  bool journalFailureReported_{false};
  /// Reason code of the latest record.
  std::string lastReason_{"BOOT"};

  double checkRateHz_{2.0};
  double livenessTimeoutS_{0.0};
  std::string vehicleStatusTopic_{"vehicle_status"};

  std::mutex mutex_;
  bool vehicleStatusSeen_{false};
  LinkSupervisor::Clock::time_point lastVehicleStatusTime_{};

  rclcpp::Subscription<joylink::msg::VehicleStatus>::SharedPtr vehicleStatusSub_;
  rclcpp::Publisher<joylink::msg::LinkStatus>::SharedPtr statusPub_;
  rclcpp::TimerBase::SharedPtr checkTimer_;
};

}  // namespace link_supervisor
