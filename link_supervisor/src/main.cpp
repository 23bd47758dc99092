#include <link_supervisor/link_supervisor_node.hpp>

#include <chrono>
#include <exception>
#include <memory>
#include <thread>

#include <rclcpp/executors/single_threaded_executor.hpp>
#include <rclcpp/rclcpp.hpp>

int main(int argc, char ** argv)
{
  rclcpp::init(argc, argv);

  std::shared_ptr<link_supervisor::LinkSupervisorNode> node;
  try {
    node = std::make_shared<link_supervisor::LinkSupervisorNode>();
  } catch (const std::exception & e) {
    RCLCPP_FATAL(rclcpp::get_logger("link_supervisor"), "Startup failed: %s", e.what());
    rclcpp::shutdown();
    return 1;
  }

  rclcpp::executors::SingleThreadedExecutor executor;
  executor.add_node(node);

  // SIGINT/SIGTERM clear rclcpp::ok(); the relay is then stopped before exit.
  while (rclcpp::ok()) {
    executor.spin_some();
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
  }

  node->shutdown();
  executor.remove_node(node);
  rclcpp::shutdown();
  return 0;
}
