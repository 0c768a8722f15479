/**
 * @file reportview.hpp
 * @brief Output surface of the command line session
 */

#ifndef REPORTVIEW_HPP
#define REPORTVIEW_HPP

#include <string>
#include <vector>

#include "filerecord.hpp"
#include "movetransaction.hpp"
#include "similaritygraph.hpp"

/**
 * @class ReportView
 * @brief Renders groups, similarity tables, move plans and previews
 *
 * Application only talks to this interface; neardup-cli passes the FTXUI
 * GroupReport, tests pass a plain text view.
 */
class ReportView {
public:
  /**
   * @param records Group members in display order
   * @param keeper Path of the current keeper
   */
  virtual void showGroup(const DuplicateGroup &group,
                         const std::vector<FileRecord> &records,
                         const std::string &keeper) = 0;

  virtual void showSimilarities(const std::vector<PairSimilarity> &pairs) = 0;

  virtual void showMovePlan(const std::vector<MoveOperation> &moves,
                            bool dryRun) = 0;

  virtual void showPreview(const std::string &path,
                           const std::string &preview) = 0;

  virtual ~ReportView() = default;
};

#endif // REPORTVIEW_HPP
