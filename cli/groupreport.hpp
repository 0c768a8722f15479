/**
 * @file groupreport.hpp
 * @brief FTXUI renderings of groups, similarity tables and move plans
 */

#ifndef GROUPREPORT_HPP
#define GROUPREPORT_HPP

#include <chrono>
#include <ostream>
#include <string>
#include <vector>

#include <ftxui/dom/elements.hpp>

#include "config.hpp"
#include "filerecord.hpp"
#include "movetransaction.hpp"
#include "reportview.hpp"
#include "similaritygraph.hpp"

/**
 * @class GroupReport
 * @brief Builds the panels printed by neardup-cli
 *
 * Each static function returns an ftxui::Element; print() lays it out on a
 * screen as wide as the terminal and writes it to a stream, so the same
 * panels work in interactive and batch mode. As a ReportView it prints the
 * panels to the stream it was created with.
 */
class GroupReport : public ReportView {
public:
  explicit GroupReport(std::ostream &out) : m_out(out) {}

  void showGroup(const DuplicateGroup &group,
                 const std::vector<FileRecord> &records,
                 const std::string &keeper) override {
    print(groupPanel(group, records, keeper), m_out);
  }
  void showSimilarities(const std::vector<PairSimilarity> &pairs) override {
    print(similarityPanel(pairs), m_out);
  }
  void showMovePlan(const std::vector<MoveOperation> &moves,
                    bool dryRun) override {
    print(movePlanPanel(moves, dryRun), m_out);
  }
  void showPreview(const std::string &path,
                   const std::string &preview) override {
    print(previewPanel(path, preview), m_out);
  }

  /**
   * @brief Table of a group's files with name, location, size, mtime and
   *        keeper mark
   *
   * @param records Group members in display order
   * @param keeper Path of the current keeper
   */
  static ftxui::Element groupPanel(const DuplicateGroup &group,
                                   const std::vector<FileRecord> &records,
                                   const std::string &keeper);

  static ftxui::Element
  similarityPanel(const std::vector<PairSimilarity> &pairs);

  static ftxui::Element movePlanPanel(const std::vector<MoveOperation> &moves,
                                      bool dryRun);

  static ftxui::Element previewPanel(const std::string &path,
                                     const std::string &preview);

  static void print(ftxui::Element element, std::ostream &out);

  static std::string formatTime(std::chrono::system_clock::time_point time);
  static std::string formatPercent(double value);

private:
  std::ostream &m_out;
};

#endif // GROUPREPORT_HPP
