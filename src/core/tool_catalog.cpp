#include "core/tool_catalog.hpp"

#include <initializer_list>
#include <utility>

namespace core::mcp {
namespace {

using nlohmann::json;

struct Property {
  const char* name;
  const char* type;
  const char* description;
};

json ObjectSchema(std::initializer_list<Property> properties = {},
                  std::initializer_list<const char*> required = {}) {
  json props = json::object();
  for (const auto& property : properties) {
    props[property.name] = {{"type", property.type}, {"description", property.description}};
  }
  json schema = {{"type", "object"}, {"properties", props}};
  if (required.size() > 0) {
    schema["required"] = json::array();
    for (const char* name : required) {
      schema["required"].push_back(name);
    }
  }
  return schema;
}

std::vector<ToolDescriptor> BuildCatalog() {
  return {
      {"create_new_file_with_text",
       "Creates a new file at the specified path within the project directory and populates it "
       "with the provided text",
       ObjectSchema({{"pathInProject", "string", "The relative path where the file should be created"},
                     {"text", "string", "The content to write into the new file"}},
                    {"pathInProject", "text"})},
      {"execute_action_by_id",
       "Executes an action by its ID in JetBrains IDE editor",
       ObjectSchema({{"actionId", "string", "The ID of the action to execute"}}, {"actionId"})},
      {"execute_terminal_command",
       "Executes a specified shell command in the IDE's integrated terminal",
       ObjectSchema({{"command", "string", "The shell command to execute"}}, {"command"})},
      {"find_commit_by_message",
       "Searches for a commit based on the provided text or keywords in the project history",
       ObjectSchema({{"query", "string", "The text or keywords to search for in commit messages"}},
                    {"query"})},
      {"find_files_by_name_substring",
       "Searches for all files in the project whose names contain the specified substring",
       ObjectSchema({{"nameSubstring", "string", "The substring to search for in file names"}},
                    {"nameSubstring"})},
      {"get_all_open_file_paths",
       "Lists full path relative paths to project root of all currently open files",
       ObjectSchema()},
      {"get_all_open_file_texts",
       "Returns text of all currently open files in the JetBrains IDE editor",
       ObjectSchema()},
      {"get_debugger_breakpoints",
       "Retrieves a list of all line breakpoints currently set in the project",
       ObjectSchema()},
      {"get_file_text_by_path",
       "Retrieves the text content of a file using its path relative to project root",
       ObjectSchema({{"pathInProject", "string", "The file location from project root"}},
                    {"pathInProject"})},
      {"get_open_in_editor_file_path",
       "Retrieves the absolute path of the currently active file",
       ObjectSchema()},
      {"get_open_in_editor_file_text",
       "Retrieves the complete text content of the currently active file",
       ObjectSchema()},
      {"get_progress_indicators",
       "Retrieves the status of all running progress indicators",
       ObjectSchema()},
      {"get_project_dependencies",
       "Get list of all dependencies defined in the project",
       ObjectSchema()},
      {"get_project_modules",
       "Get list of all modules in the project with their dependencies",
       ObjectSchema()},
      {"get_project_vcs_status",
       "Retrieves the current version control status of files in the project",
       ObjectSchema()},
      {"get_run_configurations",
       "Returns a list of run configurations for the current project",
       ObjectSchema()},
      {"get_selected_in_editor_text",
       "Retrieves the currently selected text from the active editor",
       ObjectSchema()},
      {"get_terminal_text",
       "Retrieves the current text content from the first active terminal",
       ObjectSchema()},
      {"list_available_actions",
       "Lists all available actions in JetBrains IDE editor",
       ObjectSchema()},
      {"list_directory_tree_in_folder",
       "Provides a hierarchical tree view of the project directory structure",
       ObjectSchema({{"pathInProject", "string", "The starting folder path (use '/' for project root)"},
                     {"maxDepth", "integer", "Maximum recursion depth (default: 5)"}},
                    {"pathInProject"})},
      {"list_files_in_folder",
       "Lists all files and directories in the specified project folder",
       ObjectSchema({{"pathInProject", "string", "The folder path (use '/' for project root)"}},
                    {"pathInProject"})},
      {"open_file_in_editor",
       "Opens the specified file in the JetBrains IDE editor",
       ObjectSchema({{"filePath", "string", "The path of file to open (can be absolute or relative)"}},
                    {"filePath"})},
      {"replace_current_file_text",
       "Replaces the entire content of the currently active file",
       ObjectSchema({{"text", "string", "The new content to write"}}, {"text"})},
      {"replace_file_text_by_path",
       "Replaces the entire content of a specified file with new text",
       ObjectSchema({{"pathInProject", "string", "The path to the target file, relative to project root"},
                     {"text", "string", "The new content to write"}},
                    {"pathInProject", "text"})},
      {"replace_selected_text",
       "Replaces the currently selected text in the active editor",
       ObjectSchema({{"text", "string", "The replacement content"}}, {"text"})},
      {"replace_specific_text",
       "Replaces specific text occurrences in a file with new text",
       ObjectSchema({{"pathInProject", "string", "The path to the target file, relative to project root"},
                     {"oldText", "string", "The text to be replaced"},
                     {"newText", "string", "The replacement text"}},
                    {"pathInProject", "oldText", "newText"})},
      {"run_configuration",
       "Run a specific run configuration in the current project",
       ObjectSchema({{"name", "string", "The name of the run configuration to execute"}}, {"name"})},
      {"search_in_files_content",
       "Searches for a text substring within all files in the project",
       ObjectSchema({{"searchText", "string", "The text to find"}}, {"searchText"})},
      {"toggle_debugger_breakpoint",
       "Toggles a debugger breakpoint at the specified line in a project file",
       ObjectSchema({{"filePathInProject", "string", "The relative path to the file within the project"},
                     {"line", "integer", "The line number where to toggle the breakpoint (1-based)"}},
                    {"filePathInProject", "line"})},
      {"wait",
       "Waits for a specified number of milliseconds",
       ObjectSchema({{"milliseconds", "integer", "The duration to wait in milliseconds (default: 5000)"}})},
  };
}

}  // namespace

bool SameContent(const ToolDescriptor& lhs, const ToolDescriptor& rhs) {
  return lhs.name == rhs.name && lhs.description == rhs.description &&
         lhs.input_schema == rhs.input_schema;
}

json ToJson(const ToolDescriptor& tool) {
  return {{"name", tool.name}, {"description", tool.description}, {"inputSchema", tool.input_schema}};
}

const std::vector<ToolDescriptor>& DefaultTools() {
  static const std::vector<ToolDescriptor> kTools = BuildCatalog();
  return kTools;
}

}  // namespace core::mcp
