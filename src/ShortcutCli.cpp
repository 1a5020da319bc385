#include "ShortcutCli.hpp"
#include "Config.hpp"
#include "SettingsStore.hpp"
#include "ShortcutStore.hpp"
#include <filesystem>
#include <functional>
#include <map>
#include <ostream>

namespace {

constexpr const char* USAGE = R"(Usage: shortcutctl [--config-dir DIR] COMMAND [ARGS...]

Shortcuts:
  list-apps                                  List applications with shortcuts
  show APP [GROUP]                           Show the shortcuts stored for APP
  resolve APP GROUP [LANG]                   Show what the overlay displays for APP and GROUP
  add-app APP                                Add an application
  remove-app APP                             Remove an application and its shortcuts
  add-group APP GROUP                        Add a modifier group (e.g. Ctrl+Shift)
  rename-group APP OLD NEW                   Rename a modifier group
  remove-group APP GROUP                     Remove a modifier group
  add APP GROUP KEY TEXT_EN [TEXT_ZH]        Add a shortcut
  edit APP GROUP OLD_KEY NEW_KEY TEXT_EN [TEXT_ZH]
                                             Change a shortcut
  remove APP GROUP KEY                       Remove a shortcut
  import FILE                                Merge a shortcuts JSON file

Settings:
  get SETTING                                Print a setting
  set SETTING VALUE                          Change a setting

  help                                       Show this text
)";

struct Context {
    ShortcutStore& shortcuts;
    SettingsStore& settings;
    std::ostream& out;
    std::ostream& err;
};

struct Command {
    size_t min_args;
    size_t max_args;
    std::function<int(Context&, const std::vector<std::string>&)> run;
};

std::string describe(const ShortcutDescription& desc) {
    if (desc.plain) {
        return *desc.plain;
    }
    if (desc.translations.empty()) {
        return "N/A";
    }
    std::string text;
    for (const auto& [lang, value] : desc.translations) {
        if (!text.empty()) text += "; ";
        text += lang + "=" + value;
    }
    return text;
}

ShortcutDescription localized(const std::vector<std::string>& a, size_t en_index) {
    std::map<std::string, std::string> t{{"en", a[en_index]}};
    if (a.size() > en_index + 1) {
        t["zh"] = a[en_index + 1];
    }
    return ShortcutDescription::localized(std::move(t));
}

const ModifierGroups* stored_app(const ShortcutStore& store, const std::string& app) {
    const std::string key = ascii_upper(app);
    for (const auto& [name, groups] : store.table()) {
        if (ascii_upper(name) == key) return &groups;
    }
    return nullptr;
}

int finish_shortcuts(Context& ctx, const std::expected<void, std::string>& res) {
    if (!res) {
        ctx.err << "Error: " << res.error() << '\n';
        return 1;
    }
    if (auto saved = ctx.shortcuts.save(); !saved) {
        ctx.err << "Error saving shortcuts: " << saved.error() << '\n';
        return 1;
    }
    return 0;
}

void print_group(std::ostream& out, const std::string& combo, const KeyShortcuts& keys) {
    out << combo << ":\n";
    for (const auto& [key, desc] : keys) {
        out << "  " << key << ": " << describe(desc) << '\n';
    }
}

const std::map<std::string, Command>& commands() {
    static const std::map<std::string, Command> table = {
        {"list-apps", {0, 0, [](Context& ctx, const std::vector<std::string>&) {
             for (const auto& [app, groups] : ctx.shortcuts.table()) {
                 ctx.out << app << '\n';
             }
             return 0;
         }}},
        {"show", {1, 2, [](Context& ctx, const std::vector<std::string>& a) {
             const auto* groups = stored_app(ctx.shortcuts, a[0]);
             if (!groups) {
                 ctx.err << "Error: No application named '" << a[0] << "'.\n";
                 return 1;
             }
             if (a.size() == 2) {
                 auto it = ShortcutStore::find_group(*groups, a[1]);
                 if (it == groups->end()) {
                     ctx.err << "Error: No modifier group named '" << a[1] << "'.\n";
                     return 1;
                 }
                 print_group(ctx.out, it->first, it->second);
                 return 0;
             }
             for (const auto& [combo, keys] : *groups) {
                 print_group(ctx.out, combo, keys);
             }
             return 0;
         }}},
        {"resolve", {2, 3, [](Context& ctx, const std::vector<std::string>& a) {
             auto mods = parse_modifier_combo(a[1]);
             if (!mods) {
                 ctx.err << "Error: " << mods.error() << '\n';
                 return 2;
             }
             const std::string language = a.size() == 3 ? a[2] : ctx.settings.settings().language;
             const auto* keys = ShortcutStore::group_for(ctx.shortcuts.shortcuts_for_app(a[0]), *mods);
             if (!keys) {
                 return 0;
             }
             for (const auto& [key, desc] : *keys) {
                 ctx.out << key << ": " << desc.resolve(language) << '\n';
             }
             return 0;
         }}},
        {"add-app", {1, 1, [](Context& ctx, const std::vector<std::string>& a) {
             return finish_shortcuts(ctx, ctx.shortcuts.add_application(a[0]));
         }}},
        {"remove-app", {1, 1, [](Context& ctx, const std::vector<std::string>& a) {
             return finish_shortcuts(ctx, ctx.shortcuts.remove_application(a[0]));
         }}},
        {"add-group", {2, 2, [](Context& ctx, const std::vector<std::string>& a) {
             return finish_shortcuts(ctx, ctx.shortcuts.add_modifier_group(a[0], a[1]));
         }}},
        {"rename-group", {3, 3, [](Context& ctx, const std::vector<std::string>& a) {
             return finish_shortcuts(ctx, ctx.shortcuts.rename_modifier_group(a[0], a[1], a[2]));
         }}},
        {"remove-group", {2, 2, [](Context& ctx, const std::vector<std::string>& a) {
             return finish_shortcuts(ctx, ctx.shortcuts.remove_modifier_group(a[0], a[1]));
         }}},
        {"add", {4, 5, [](Context& ctx, const std::vector<std::string>& a) {
             return finish_shortcuts(ctx, ctx.shortcuts.add_shortcut(a[0], a[1], a[2], localized(a, 3)));
         }}},
        {"edit", {5, 6, [](Context& ctx, const std::vector<std::string>& a) {
             return finish_shortcuts(ctx, ctx.shortcuts.edit_shortcut(a[0], a[1], a[2], a[3], localized(a, 4)));
         }}},
        {"remove", {3, 3, [](Context& ctx, const std::vector<std::string>& a) {
             return finish_shortcuts(ctx, ctx.shortcuts.remove_shortcut(a[0], a[1], a[2]));
         }}},
        {"import", {1, 1, [](Context& ctx, const std::vector<std::string>& a) {
             return finish_shortcuts(ctx, ctx.shortcuts.import_file(a[0]));
         }}},
        {"get", {1, 1, [](Context& ctx, const std::vector<std::string>& a) {
             auto value = ctx.settings.get_value(a[0]);
             if (!value) {
                 ctx.err << "Error: " << value.error() << '\n';
                 return 1;
             }
             ctx.out << *value << '\n';
             return 0;
         }}},
        {"set", {2, 2, [](Context& ctx, const std::vector<std::string>& a) {
             if (auto res = ctx.settings.set_value(a[0], a[1]); !res) {
                 ctx.err << "Error: " << res.error() << '\n';
                 return 1;
             }
             if (auto saved = ctx.settings.save(); !saved) {
                 ctx.err << "Error saving settings: " << saved.error() << '\n';
                 return 1;
             }
             return 0;
         }}},
    };
    return table;
}

std::filesystem::path default_config_dir() {
    auto cfg = AppConfig::load("config.yaml");
    return cfg ? cfg->paths.config_dir : AppConfig::defaults().paths.config_dir;
}

} // namespace

int run_shortcut_cli(const std::vector<std::string>& args, std::ostream& out, std::ostream& err) {
    std::vector<std::string> rest(args);
    std::filesystem::path config_dir;
    if (!rest.empty() && rest.front() == "--config-dir") {
        if (rest.size() < 2) {
            err << "--config-dir needs a directory\n" << USAGE;
            return 2;
        }
        config_dir = rest[1];
        rest.erase(rest.begin(), rest.begin() + 2);
    } else {
        config_dir = default_config_dir();
    }

    if (rest.empty()) {
        err << USAGE;
        return 2;
    }
    const std::string name = rest.front();
    rest.erase(rest.begin());

    if (name == "help" || name == "--help" || name == "-h") {
        out << USAGE;
        return 0;
    }
    auto it = commands().find(name);
    if (it == commands().end()) {
        err << "Unknown command '" << name << "'\n" << USAGE;
        return 2;
    }
    const Command& cmd = it->second;
    if (rest.size() < cmd.min_args || rest.size() > cmd.max_args) {
        err << "Wrong number of arguments for '" << name << "'\n" << USAGE;
        return 2;
    }

    ShortcutStore shortcuts(config_dir / "shortcuts.json");
    SettingsStore settings(config_dir / "settings.json");
    shortcuts.load_or_create();
    settings.load_or_create();

    Context ctx{shortcuts, settings, out, err};
    return cmd.run(ctx, rest);
}
