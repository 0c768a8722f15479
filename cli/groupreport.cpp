#include "groupreport.hpp"
#include "utils.hpp"

#include <ftxui/screen/screen.hpp>

#include <cstdio>
#include <ctime>
#include <filesystem>

using namespace ftxui;

std::string GroupReport::formatTime(std::chrono::system_clock::time_point time) {
  std::time_t t = std::chrono::system_clock::to_time_t(time);
  std::tm tm{};
  localtime_r(&t, &tm);

  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
  return std::string(buf);
}

std::string GroupReport::formatPercent(double value) {
  char buf[16];
  snprintf(buf, sizeof(buf), "%.1f%%", value * 100.0);
  return std::string(buf);
}

Element GroupReport::groupPanel(const DuplicateGroup &group,
                                const std::vector<FileRecord> &records,
                                const std::string &keeper) {
  auto header = hbox({text("#") | bold | size(WIDTH, EQUAL, 4),
                      text("Name") | bold | size(WIDTH, LESS_THAN, 30),
                      text(" Location") | bold | flex,
                      text("Size") | bold | align_right | size(WIDTH, EQUAL, 10),
                      text(" Modified") | bold | size(WIDTH, EQUAL, 21)}) |
                color(Color::Cyan);

  Elements rows;
  for (std::size_t i = 0; i < records.size(); ++i) {
    const FileRecord &record = records[i];
    const bool isKeeper = record.getPath() == keeper;

    auto row = hbox({text(std::to_string(i + 1)) | size(WIDTH, EQUAL, 4),
                     text(record.getDisplayName()) | size(WIDTH, LESS_THAN, 30),
                     text(" " + std::filesystem::path(record.getPath())
                                    .parent_path()
                                    .string()) |
                         flex,
                     text(formatBytes(record.getFileSize())) | align_right |
                         size(WIDTH, EQUAL, 10),
                     text(" " + formatTime(record.getModifiedTime())) |
                         size(WIDTH, EQUAL, 21)});
    if (isKeeper)
      row = hbox({row | flex, text(" keep") | bold}) | color(Color::Green);
    rows.push_back(row);
  }

  std::string title = "Group " + std::to_string(group.id) + " (" +
                      std::to_string(group.files.size()) + " files, " +
                      formatPercent(group.similarity) + " similar)";

  return vbox({text(title) | bold | color(Color::Green), separator(), header,
               separator(), vbox(std::move(rows))}) |
         border;
}

Element GroupReport::similarityPanel(const std::vector<PairSimilarity> &pairs) {
  Elements rows;
  for (const auto &pair : pairs) {
    std::string weight = formatPercent(pair.weight);
    if (pair.inherited)
      weight += " *";
    rows.push_back(hbox({text(pair.first) | flex, text(" <-> "),
                         text(pair.second) | flex,
                         text(weight) | align_right | size(WIDTH, EQUAL, 10)}));
  }
  if (rows.empty())
    rows.push_back(text("No direct edges") | dim);

  return vbox({text("Pairwise similarity") | bold | color(Color::Green),
               separator(), vbox(std::move(rows)), separator(),
               text("* inherited from the group representative") | dim}) |
         border;
}

Element GroupReport::movePlanPanel(const std::vector<MoveOperation> &moves,
                                   bool dryRun) {
  Elements rows;
  for (const auto &move : moves) {
    auto row = hbox({text(move.source.string()) | flex, text(" -> "),
                     text(move.destination.string()) | flex});
    if (dryRun)
      row = row | dim;
    rows.push_back(row);
  }

  std::string title = dryRun ? "Planned moves (dry run)" : "Moves";
  return vbox({text(title) | bold | color(Color::Yellow), separator(),
               vbox(std::move(rows))}) |
         border;
}

Element GroupReport::previewPanel(const std::string &path,
                                  const std::string &preview) {
  Elements lines;
  std::size_t start = 0;
  while (start <= preview.size()) {
    std::size_t end = preview.find('\n', start);
    if (end == std::string::npos)
      end = preview.size();
    lines.push_back(text(preview.substr(start, end - start)));
    start = end + 1;
  }
  return vbox({text(path) | bold | color(Color::Cyan), separator(),
               vbox(std::move(lines))}) |
         border;
}

void GroupReport::print(Element element, std::ostream &out) {
  auto screen = Screen::Create(Dimension::Full(), Dimension::Fit(element));
  Render(screen, element);
  out << screen.ToString() << '\n';
}
