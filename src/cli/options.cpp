#include "filecenter/cli/options.hpp"

#include <cstring>
#include <string>

#include "filecenter/core/config.hpp"

namespace filecenter::cli {
    using filecenter::core::Status;
    using filecenter::core::StatusCode;
    using filecenter::core::StatusDomain;

    namespace {
        Status cli_invalid() noexcept {
            return filecenter::core::make_status(StatusDomain::Cli, StatusCode::Invalid);
        }

        const OptionDef* lookup(const OptionDef* defs, u32 def_count, const char* name, std::size_t name_len) noexcept {
            for (u32 i = 0; i < def_count; ++i) {
                const char* n = defs[i].name;
                if (n != nullptr && std::strncmp(n, name, name_len) == 0 && n[name_len] == '\0') {
                    return &defs[i];
                }
            }
            return nullptr;
        }

        const OptionDef* lookup_letter(const OptionDef* defs, u32 def_count, char letter) noexcept {
            for (u32 i = 0; i < def_count; ++i) {
                if (defs[i].letter != '\0' && defs[i].letter == letter) {
                    return &defs[i];
                }
            }
            return nullptr;
        }
    } // namespace

    const OptionHit* OptionSet::last(OptionId id) const noexcept {
        for (u32 i = len; i > 0; --i) {
            if (hits[i - 1].id == id) {
                return &hits[i - 1];
            }
        }
        return nullptr;
    }

    Status take_options(CliArgs* args, const OptionDef* defs, u32 def_count, OptionSet* out) noexcept {
        if (args == nullptr || out == nullptr || (def_count > 0 && defs == nullptr)) {
            return cli_invalid();
        }
        if (args->argc > 0 && args->argv == nullptr) {
            return cli_invalid();
        }
        out->len = 0;

        while (args->argc > 0) {
            const char* tok = args->argv[0];
            if (tok == nullptr || tok[0] != '-' || tok[1] == '\0') {
                return filecenter::core::ok_status();
            }
            if (std::strcmp(tok, "--") == 0) {
                ++args->argv;
                --args->argc;
                return filecenter::core::ok_status();
            }

            // --name, --name=value, -x, -xVALUE
            const OptionDef* def = nullptr;
            const char* attached = nullptr;
            if (tok[1] == '-') {
                const char* name = tok + 2;
                const char* eq = std::strchr(name, '=');
                const std::size_t name_len = eq != nullptr ? static_cast<std::size_t>(eq - name) : std::strlen(name);
                def = lookup(defs, def_count, name, name_len);
                attached = eq != nullptr ? eq + 1 : nullptr;
            } else {
                def = lookup_letter(defs, def_count, tok[1]);
                attached = tok[2] != '\0' ? tok + 2 : nullptr;
            }
            if (def == nullptr || out->len >= out->cap || out->hits == nullptr) {
                return cli_invalid();
            }

            u32 used = 1;
            const char* value = attached;
            if (def->kind == ValueKind::Switch) {
                if (attached != nullptr) {
                    return cli_invalid();
                }
            } else if (value == nullptr) {
                if (args->argc < 2 || args->argv[1] == nullptr) {
                    return cli_invalid();
                }
                value = args->argv[1];
                used = 2;
            }

            OptionHit hit{};
            hit.id = def->id;
            if (def->kind == ValueKind::Text) {
                hit.text = value;
            } else if (def->kind == ValueKind::Count) {
                if (!filecenter::core::parse_u64(value, &hit.count)) {
                    return cli_invalid();
                }
                hit.text = value;
            }
            out->hits[out->len++] = hit;
            args->argv += used;
            args->argc -= used;
        }
        return filecenter::core::ok_status();
    }

    void print_options(std::FILE* f, const OptionDef* defs, u32 def_count) noexcept {
        for (u32 i = 0; i < def_count; ++i) {
            const OptionDef& d = defs[i];
            if (d.help == nullptr) {
                continue;
            }
            std::string form = "--";
            form += d.name;
            if (d.letter != '\0') {
                form = std::string("-") + d.letter + ", " + form;
            }
            if (d.kind == ValueKind::Text) {
                form += " VALUE";
            } else if (d.kind == ValueKind::Count) {
                form += " N";
            }
            std::fprintf(f, "  %-24s %s\n", form.c_str(), d.help);
        }
    }
} // namespace filecenter::cli
