#include "skiff/client/ftp_listing.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <chrono>
#include <charconv>
#include <vector>

#include <spdlog/spdlog.h>

namespace skiff::client
{

    namespace
    {

        constexpr std::array<std::string_view, 12> kMonths{"Jan", "Feb", "Mar", "Apr", "May", "Jun",
                                                           "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"};
        constexpr std::int64_t kSecondsPerDay = 24 * 60 * 60;
        // ls switches from "HH:MM" to the year for entries older than about six months.
        constexpr std::int64_t kRecentWindow = 180 * kSecondsPerDay;

        struct Token
        {
            std::string_view text;
            std::size_t end;
        };

        std::vector<Token> tokenize(std::string_view line)
        {
            std::vector<Token> tokens;
            std::size_t pos = 0;
            while (pos < line.size())
            {
                while (pos < line.size() && std::isspace(static_cast<unsigned char>(line[pos])))
                {
                    ++pos;
                }
                if (pos >= line.size())
                {
                    break;
                }
                const auto start = pos;
                while (pos < line.size() && !std::isspace(static_cast<unsigned char>(line[pos])))
                {
                    ++pos;
                }
                tokens.push_back(Token{line.substr(start, pos - start), pos});
            }
            return tokens;
        }

        template <typename T>
        std::optional<T> to_number(std::string_view text)
        {
            T value{};
            const auto *last = text.data() + text.size();
            const auto [ptr, ec] = std::from_chars(text.data(), last, value);
            if (text.empty() || ec != std::errc{} || ptr != last)
            {
                return std::nullopt;
            }
            return value;
        }

        std::optional<unsigned> month_from_name(std::string_view name)
        {
            if (name.size() != 3)
            {
                return std::nullopt;
            }
            for (std::size_t i = 0; i < kMonths.size(); ++i)
            {
                const auto month = kMonths[i];
                bool equal = true;
                for (std::size_t c = 0; c < 3; ++c)
                {
                    if (std::tolower(static_cast<unsigned char>(name[c])) != std::tolower(static_cast<unsigned char>(month[c])))
                    {
                        equal = false;
                        break;
                    }
                }
                if (equal)
                {
                    return static_cast<unsigned>(i + 1);
                }
            }
            return std::nullopt;
        }

        std::optional<std::int64_t> make_unix_time(int year, unsigned month, unsigned day, int hour, int minute,
                                                   int second)
        {
            using namespace std::chrono;
            const year_month_day date{std::chrono::year{year}, std::chrono::month{month}, std::chrono::day{day}};
            if (!date.ok() || hour < 0 || hour > 23 || minute < 0 || minute > 59 || second < 0 || second > 60)
            {
                return std::nullopt;
            }
            const auto time = sys_days{date} + hours{hour} + minutes{minute} + seconds{second};
            return duration_cast<seconds>(time.time_since_epoch()).count();
        }

        struct CivilTime
        {
            int year;
            unsigned month;
            unsigned day;
            int hour;
            int minute;
        };

        CivilTime civil_from_unix(std::int64_t unix_time)
        {
            using namespace std::chrono;
            const sys_seconds time{seconds{unix_time}};
            const auto midnight = floor<days>(time);
            const year_month_day date{midnight};
            const auto seconds_of_day = (time - midnight).count();
            return CivilTime{static_cast<int>(date.year()), static_cast<unsigned>(date.month()),
                             static_cast<unsigned>(date.day()), static_cast<int>(seconds_of_day / 3600),
                             static_cast<int>((seconds_of_day % 3600) / 60)};
        }

        std::optional<std::uint32_t> parse_permissions(std::string_view bits)
        {
            if (bits.size() < 9)
            {
                return std::nullopt;
            }
            std::uint32_t mode = 0;
            for (std::size_t triad = 0; triad < 3; ++triad)
            {
                const auto shift = static_cast<std::uint32_t>(6 - 3 * triad);
                const char r = bits[triad * 3];
                const char w = bits[triad * 3 + 1];
                const char x = bits[triad * 3 + 2];
                if (r == 'r')
                {
                    mode |= 04u << shift;
                }
                else if (r != '-')
                {
                    return std::nullopt;
                }
                if (w == 'w')
                {
                    mode |= 02u << shift;
                }
                else if (w != '-')
                {
                    return std::nullopt;
                }
                constexpr std::array<std::uint32_t, 3> kSpecial{04000u, 02000u, 01000u};
                switch (x)
                {
                case 'x':
                    mode |= 01u << shift;
                    break;
                case 's':
                case 't':
                    mode |= (01u << shift) | kSpecial[triad];
                    break;
                case 'S':
                case 'T':
                    mode |= kSpecial[triad];
                    break;
                case '-':
                    break;
                default:
                    return std::nullopt;
                }
            }
            return mode;
        }

        std::string format_permissions(std::uint32_t mode)
        {
            std::string bits(9, '-');
            constexpr std::array<std::uint32_t, 3> kSpecial{04000u, 02000u, 01000u};
            constexpr std::array<char, 3> kSpecialLetter{'s', 's', 't'};
            for (std::size_t triad = 0; triad < 3; ++triad)
            {
                const auto shift = static_cast<std::uint32_t>(6 - 3 * triad);
                if (mode & (04u << shift))
                {
                    bits[triad * 3] = 'r';
                }
                if (mode & (02u << shift))
                {
                    bits[triad * 3 + 1] = 'w';
                }
                const bool exec = (mode & (01u << shift)) != 0;
                if (mode & kSpecial[triad])
                {
                    const char letter = kSpecialLetter[triad];
                    bits[triad * 3 + 2] = exec ? letter : static_cast<char>(std::toupper(letter));
                }
                else if (exec)
                {
                    bits[triad * 3 + 2] = 'x';
                }
            }
            return bits;
        }

        std::optional<std::int64_t> resolve_unix_date(unsigned month, unsigned day, std::string_view year_or_time,
                                                      std::int64_t now)
        {
            if (const auto colon = year_or_time.find(':'); colon != std::string_view::npos)
            {
                const auto hour = to_number<int>(year_or_time.substr(0, colon));
                const auto minute = to_number<int>(year_or_time.substr(colon + 1));
                if (!hour || !minute)
                {
                    return std::nullopt;
                }
                const int current_year = civil_from_unix(now).year;
                auto guess = make_unix_time(current_year, month, day, *hour, *minute, 0);
                if (!guess || *guess > now + kSecondsPerDay)
                {
                    guess = make_unix_time(current_year - 1, month, day, *hour, *minute, 0);
                }
                return guess;
            }
            const auto year = to_number<int>(year_or_time);
            if (!year)
            {
                return std::nullopt;
            }
            return make_unix_time(*year, month, day, 0, 0, 0);
        }

        std::string_view trim_left(std::string_view text)
        {
            while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front())))
            {
                text.remove_prefix(1);
            }
            return text;
        }

        std::string_view trim_right(std::string_view text)
        {
            while (!text.empty() && (text.back() == '\r' || text.back() == '\n'))
            {
                text.remove_suffix(1);
            }
            return text;
        }

        std::optional<RemoteEntry> parse_unix_line(std::string_view line, std::int64_t now)
        {
            const auto tokens = tokenize(line);
            if (tokens.size() < 5)
            {
                return std::nullopt;
            }
            const auto perms = tokens[0].text;
            if (perms.size() < 10)
            {
                return std::nullopt;
            }

            RemoteEntry entry;
            switch (perms[0])
            {
            case '-':
                entry.kind = EntryKind::File;
                break;
            case 'd':
                entry.kind = EntryKind::Directory;
                break;
            case 'l':
                entry.kind = EntryKind::Symlink;
                break;
            default:
                // Devices, pipes, sockets and doors are not transferable.
                return std::nullopt;
            }
            entry.permissions = parse_permissions(perms.substr(1, 9));
            if (!entry.permissions)
            {
                return std::nullopt;
            }

            // The group column (and sometimes the link count) may be missing, so
            // anchor on the "<size> <Mon> <day> <time|year>" sequence instead.
            for (std::size_t i = 2; i + 2 < tokens.size(); ++i)
            {
                const auto month = month_from_name(tokens[i].text);
                const auto size = to_number<std::uint64_t>(tokens[i - 1].text);
                const auto day = to_number<unsigned>(tokens[i + 1].text);
                if (!month || !size || !day)
                {
                    continue;
                }
                const auto mtime = resolve_unix_date(*month, *day, tokens[i + 2].text, now);
                if (!mtime)
                {
                    continue;
                }
                // Exactly one separator precedes the name, which may itself start with spaces.
                auto name = line.substr(std::min(tokens[i + 2].end + 1, line.size()));
                if (name.empty())
                {
                    return std::nullopt;
                }
                if (entry.kind == EntryKind::Symlink)
                {
                    if (const auto arrow = name.find(" -> "); arrow != std::string_view::npos)
                    {
                        entry.link_target = std::string(name.substr(arrow + 4));
                        name = name.substr(0, arrow);
                    }
                }
                entry.name = std::string(name);
                entry.size = *size;
                entry.modified_time = *mtime;
                return entry;
            }
            return std::nullopt;
        }

        // 01-15-24  03:45PM       <DIR>          folder
        // 01-15-2024  15:45              1234 file.txt
        std::optional<RemoteEntry> parse_dos_line(std::string_view line)
        {
            const auto tokens = tokenize(line);
            if (tokens.size() < 4)
            {
                return std::nullopt;
            }
            const auto date = tokens[0].text;
            if (date.size() < 8 || date[2] != '-' || date[5] != '-')
            {
                return std::nullopt;
            }
            const auto month = to_number<unsigned>(date.substr(0, 2));
            const auto day = to_number<unsigned>(date.substr(3, 2));
            auto year = to_number<int>(date.substr(6));
            if (!month || !day || !year)
            {
                return std::nullopt;
            }
            if (date.size() == 8)
            {
                *year += *year < 70 ? 2000 : 1900;
            }

            auto time = tokens[1].text;
            bool pm = false;
            bool am = false;
            if (time.size() > 2)
            {
                const auto suffix = time.substr(time.size() - 2);
                pm = suffix == "PM" || suffix == "pm";
                am = suffix == "AM" || suffix == "am";
                if (pm || am)
                {
                    time.remove_suffix(2);
                }
            }
            const auto colon = time.find(':');
            if (colon == std::string_view::npos)
            {
                return std::nullopt;
            }
            auto hour = to_number<int>(time.substr(0, colon));
            const auto minute = to_number<int>(time.substr(colon + 1));
            if (!hour || !minute)
            {
                return std::nullopt;
            }
            if (pm && *hour < 12)
            {
                *hour += 12;
            }
            else if (am && *hour == 12)
            {
                *hour = 0;
            }

            const auto mtime = make_unix_time(*year, *month, *day, *hour, *minute, 0);
            if (!mtime)
            {
                return std::nullopt;
            }

            RemoteEntry entry;
            entry.modified_time = *mtime;
            if (tokens[2].text == "<DIR>")
            {
                entry.kind = EntryKind::Directory;
            }
            else
            {
                const auto size = to_number<std::uint64_t>(tokens[2].text);
                if (!size)
                {
                    return std::nullopt;
                }
                entry.size = *size;
            }
            const auto name = trim_left(line.substr(tokens[2].end));
            if (name.empty())
            {
                return std::nullopt;
            }
            entry.name = std::string(name);
            return entry;
        }

        std::string to_lower(std::string_view text)
        {
            std::string result(text);
            for (auto &ch : result)
            {
                ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
            }
            return result;
        }

        bool is_listing_noise(std::string_view line)
        {
            if (line.empty())
            {
                return true;
            }
            return line.size() >= 6 && to_lower(line.substr(0, 6)) == "total ";
        }

        bool is_dot_entry(const RemoteEntry &entry)
        {
            return entry.name == "." || entry.name == "..";
        }

    } // namespace

    std::optional<std::int64_t> parse_ftp_timestamp(std::string_view value)
    {
        if (value.size() < 14)
        {
            return std::nullopt;
        }
        const auto year = to_number<int>(value.substr(0, 4));
        const auto month = to_number<unsigned>(value.substr(4, 2));
        const auto day = to_number<unsigned>(value.substr(6, 2));
        const auto hour = to_number<int>(value.substr(8, 2));
        const auto minute = to_number<int>(value.substr(10, 2));
        const auto second = to_number<int>(value.substr(12, 2));
        if (!year || !month || !day || !hour || !minute || !second)
        {
            return std::nullopt;
        }
        return make_unix_time(*year, *month, *day, *hour, *minute, *second);
    }

    std::string format_ftp_timestamp(std::int64_t unix_time)
    {
        const auto civil = civil_from_unix(unix_time);
        const auto second = ((unix_time % 60) + 60) % 60;
        return spdlog::fmt_lib::format("{:04}{:02}{:02}{:02}{:02}{:02}", civil.year, civil.month, civil.day,
                                       civil.hour, civil.minute, second);
    }

    std::optional<RemoteEntry> parse_list_line(std::string_view line, std::int64_t now)
    {
        line = trim_right(line);
        if (line.empty())
        {
            return std::nullopt;
        }
        if (std::isdigit(static_cast<unsigned char>(line.front())))
        {
            return parse_dos_line(line);
        }
        return parse_unix_line(line, now);
    }

    std::optional<RemoteEntry> parse_mlsd_line(std::string_view line)
    {
        line = trim_right(line);
        const auto separator = line.find(' ');
        if (separator == std::string_view::npos || separator + 1 >= line.size())
        {
            return std::nullopt;
        }
        auto facts = line.substr(0, separator);
        const auto name = line.substr(separator + 1);

        RemoteEntry entry;
        entry.name = std::string(name);
        bool have_type = false;
        while (!facts.empty())
        {
            const auto semicolon = facts.find(';');
            const auto fact = facts.substr(0, semicolon);
            facts = semicolon == std::string_view::npos ? std::string_view{} : facts.substr(semicolon + 1);
            const auto eq = fact.find('=');
            if (eq == std::string_view::npos)
            {
                continue;
            }
            const auto key = to_lower(fact.substr(0, eq));
            const auto value = fact.substr(eq + 1);
            if (key == "type")
            {
                const auto type = to_lower(value);
                if (type == "file")
                {
                    entry.kind = EntryKind::File;
                }
                else if (type == "dir" || type == "cdir" || type == "pdir")
                {
                    entry.kind = EntryKind::Directory;
                    if (type != "dir")
                    {
                        entry.name = type == "cdir" ? "." : "..";
                    }
                }
                else if (type.rfind("os.unix=slink", 0) == 0 || type.rfind("os.unix=symlink", 0) == 0)
                {
                    entry.kind = EntryKind::Symlink;
                    if (const auto colon = value.find(':'); colon != std::string_view::npos)
                    {
                        entry.link_target = std::string(value.substr(colon + 1));
                    }
                }
                else
                {
                    return std::nullopt;
                }
                have_type = true;
            }
            else if (key == "size")
            {
                const auto size = to_number<std::uint64_t>(value);
                if (!size)
                {
                    return std::nullopt;
                }
                entry.size = *size;
            }
            else if (key == "modify")
            {
                const auto mtime = parse_ftp_timestamp(value);
                if (!mtime)
                {
                    return std::nullopt;
                }
                entry.modified_time = *mtime;
            }
            else if (key == "unix.mode")
            {
                std::uint32_t mode = 0;
                const auto *last = value.data() + value.size();
                const auto [ptr, ec] = std::from_chars(value.data(), last, mode, 8);
                if (ec == std::errc{} && ptr == last)
                {
                    entry.permissions = mode & 07777u;
                }
            }
        }
        if (!have_type)
        {
            return std::nullopt;
        }
        return entry;
    }

    Listing parse_listing(std::string_view text, const std::string &directory, ListingFormat format, std::int64_t now)
    {
        Listing listing;
        while (!text.empty())
        {
            const auto newline = text.find('\n');
            const auto line = trim_right(text.substr(0, newline));
            text = newline == std::string_view::npos ? std::string_view{} : text.substr(newline + 1);
            if (is_listing_noise(line))
            {
                continue;
            }
            auto entry = format == ListingFormat::Mlsd ? parse_mlsd_line(line) : parse_list_line(line, now);
            if (!entry)
            {
                spdlog::debug("Skipping unparseable listing line: {}", line);
                ++listing.skipped_lines;
                continue;
            }
            if (is_dot_entry(*entry))
            {
                continue;
            }
            entry->path = join_remote(directory, entry->name);
            listing.entries.push_back(std::move(*entry));
        }
        return listing;
    }

    std::string format_list_line(const RemoteEntry &entry, std::int64_t now)
    {
        char type = '-';
        std::uint32_t default_mode = 0644;
        if (entry.kind == EntryKind::Directory)
        {
            type = 'd';
            default_mode = 0755;
        }
        else if (entry.kind == EntryKind::Symlink)
        {
            type = 'l';
            default_mode = 0777;
        }

        const auto civil = civil_from_unix(entry.modified_time);
        std::string when;
        if (entry.modified_time > now - kRecentWindow && entry.modified_time <= now + kSecondsPerDay)
        {
            when = spdlog::fmt_lib::format("{:02}:{:02}", civil.hour, civil.minute);
        }
        else
        {
            when = spdlog::fmt_lib::format("{}", civil.year);
        }

        auto line = spdlog::fmt_lib::format("{}{} 1 owner group {:>10} {} {:>2} {:>5} {}", type,
                                format_permissions(entry.permissions.value_or(default_mode)), entry.size,
                                kMonths[civil.month - 1], civil.day, when, entry.name);
        if (entry.kind == EntryKind::Symlink && entry.link_target)
        {
            line += " -> " + *entry.link_target;
        }
        return line;
    }

} // namespace skiff::client
