#include <jtp/util/log_impl.hpp>

#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <map>
#include <sstream>
#include <stdexcept>

#include <fmt/chrono.h>

Log::LogImpl::LogImpl(LogFlags log_flags, std::string_view log_name)
    : m_LogName(log_name)
    , m_LogFlags(log_flags)
{
    if (IsAnySet(m_LogFlags, LogFlags::File))
    {
        CreateLogFile();
    }
}

Log::LogImpl::~LogImpl()
{
    UnregisterInstance();
}

Log* Log::LogImpl::GetInstance(std::string_view log_name)
{
    std::shared_lock<std::shared_mutex> read_lock(g_InstanceListMutex);

    auto it = g_Instances.find(std::string{ log_name });
    if (it != g_Instances.end())
        return it->second->m_ParentLog;
    return nullptr;
}

void Log::LogImpl::RegisterInstance(Log* parent_log)
{
    UnregisterInstance();

    m_ParentLog = parent_log;

    std::unique_lock<std::shared_mutex> write_lock(g_InstanceListMutex);
    if (g_Instances.contains(m_LogName))
    {
        throw std::logic_error{ fmt::format("Log-Name Redefinition: {}", m_LogName) };
    }
    g_Instances[m_LogName] = this;
}

void Log::LogImpl::UnregisterInstance()
{
    std::unique_lock<std::shared_mutex> write_lock(g_InstanceListMutex);

    auto it = g_Instances.find(m_LogName);
    if (it != g_Instances.end() && it->second == this)
    {
        g_Instances.erase(it);
    }
    m_ParentLog = nullptr;
}

uint32_t Log::LogImpl::InstallHook(Log::LogHook hook)
{
    std::lock_guard lock{ m_Mutex };
    m_LogHooks.push_back({ m_NextHookId++, std::move(hook) });
    return m_LogHooks.back().m_HookId;
}

void Log::LogImpl::UninstallHook(uint32_t hook_id)
{
    std::lock_guard lock{ m_Mutex };
    std::erase_if(m_LogHooks,
                  [hook_id](const InstalledLogHook& hook)
                  { return hook.m_HookId == hook_id; });
}

bool Log::LogImpl::GetStacktraceEnabled(LogLevel level) const
{
    return (level == LogLevel::Error && IsAnySet(m_LogFlags, LogFlags::DetailErrorStacktrace)) ||
           (level == LogLevel::Fatal && IsAnySet(m_LogFlags, LogFlags::DetailFatalStacktrace));
}

void Log::LogImpl::Print(const Log::DetailInformation& detail_info, Log::LogLevel level, const char* message)
{
    Flush(detail_info, level, message);

    if (IsAnySet(m_LogFlags, LogFlags::FatalQuit) && level == LogLevel::Fatal)
    {
        std::exit(-1);
    }
}

void Log::LogImpl::Flush(const DetailInformation& detail_info, LogLevel level, const char* message)
{
    std::stringstream stream;

    if (message[0] == '\n')
    {
        stream << "\n";
        message++;
    }

    // The error prefix
    const char* prefix{ "[???]" };
    switch (level)
    {
    case LogLevel::Information:
        prefix = " [INFO]";
        break;
    case LogLevel::Debug:
        prefix = "[DEBUG]";
        break;
    case LogLevel::Warning:
        prefix = " [WARN]";
        break;
    case LogLevel::Error:
        prefix = "[ERROR]";
        break;
    case LogLevel::Fatal:
        prefix = "[FATAL]";
        break;
    }
    stream << prefix;

    // Detailed information, e.g. time, file, line...
    const LogFlags detail_bits{ m_LogFlags & LogFlags::DetailAll };
    if (detail_bits != LogFlags::None)
    {
        const auto get_highest_order_bit{
            [](LogFlags flags)
            {
                using underlying_t = std::underlying_type_t<LogFlags>;
                const underlying_t cast_flags{ static_cast<underlying_t>(flags) };
                underlying_t max{ 0x0 };

                for (size_t i = 1; i < sizeof(underlying_t) * 8; i++)
                {
                    max = std::max(max, static_cast<underlying_t>((underlying_t{ 0x1 } << i) & cast_flags));
                }

                return static_cast<LogFlags>(max);
            }
        };
        const LogFlags highest_bit{ get_highest_order_bit(detail_bits) };

        // Conditional delimiter
#define CON_DEL(bit) (IsAnySet(bit, highest_bit) ? "" : "; ")

        stream << "<";
        if (IsAnySet(detail_bits, LogFlags::DetailTime))
            stream << detail_info.m_Time << CON_DEL(LogFlags::DetailTime);
        if (IsAnySet(detail_bits, LogFlags::DetailFile))
        {
#ifdef JTP_SOURCE_ROOT
            constexpr std::string_view c_SourceRoot{ JTP_SOURCE_ROOT };
            if (detail_info.m_File.starts_with(c_SourceRoot))
            {
                stream << detail_info.m_File.substr(c_SourceRoot.size()) << CON_DEL(LogFlags::DetailFile);
            }
            else
#endif
            {
                stream << detail_info.m_File << CON_DEL(LogFlags::DetailFile);
            }
        }
        if (IsAnySet(detail_bits, LogFlags::DetailLine))
        {
            if (IsAnySet(detail_bits, LogFlags::DetailColumn))
            {
                stream << detail_info.m_Line << ":" << detail_info.m_Column << CON_DEL(LogFlags::DetailColumn);
            }
            else
            {
                stream << detail_info.m_Line << CON_DEL(LogFlags::DetailLine);
            }
        }
        if (IsAnySet(detail_bits, LogFlags::DetailFunction))
            stream << detail_info.m_Function << CON_DEL(LogFlags::DetailFunction);
        stream << ">";

#undef CON_DEL
    }

    stream << ": ";

    // The message
    stream << std::string_view(message) << "\n";

    if (GetStacktraceEnabled(level))
    {
#ifdef __cpp_lib_stacktrace
        if (!detail_info.m_StackTrace.empty())
        {
            stream << "Stacktrace:\n";
            for (std::string_view stack_element : detail_info.m_StackTrace)
            {
                stream << stack_element << "\n";
            }
        }
        else
#endif
        {
            stream << "[[Stacktrace not available]]\n";
        }
    }

    const std::string full_message_str{ stream.str() };
    std::lock_guard lock{ m_Mutex };

    // stdout may carry the pdf, so the console log goes to stderr
    if (IsAnySet(m_LogFlags, LogFlags::Console))
    {
        fmt::print(stderr, "{}", full_message_str);
    }
    if (m_FileStream.is_open())
    {
        m_FileStream << full_message_str << std::flush;
    }

    // Forward to hooks
    for (const InstalledLogHook& hook : m_LogHooks)
    {
        hook.m_Hook(detail_info, level, message);
    }
}

void Log::LogImpl::CreateLogFile()
{
    namespace fs = std::filesystem;

    char file_name_buffer[256]{};
    fmt::format_to_n(file_name_buffer, 255, "logs/{:%Y-%m-%d_%H-%M-%S}.log", fmt::localtime(std::time(nullptr)));

    const fs::path logs_directory{ fs::absolute("logs") };
    if (!fs::exists(logs_directory) || !fs::is_directory(logs_directory))
    {
        if (fs::exists(logs_directory))
        {
            fs::remove_all(logs_directory);
        }
        fs::create_directories(logs_directory);
    }

    std::multimap<fs::file_time_type, fs::path> files_sorted_by_modify_time;
    for (fs::directory_iterator dir_iter(logs_directory); dir_iter != fs::directory_iterator{}; ++dir_iter)
    {
        if (fs::is_regular_file(dir_iter->status()))
        {
            files_sorted_by_modify_time.insert({ fs::last_write_time(dir_iter->path()), dir_iter->path() });
        }
    }

    static constexpr std::size_t c_MaxNumLogFiles = 256;
    const std::size_t num_files = files_sorted_by_modify_time.size();
    if (num_files >= c_MaxNumLogFiles)
    {
        const std::size_t files_to_delete = num_files - c_MaxNumLogFiles + 1;
        auto it = files_sorted_by_modify_time.begin();
        for (std::size_t i = 0; i < files_to_delete; i++, ++it)
        {
            fs::remove(it->second);
        }
    }

    std::lock_guard lock{ m_Mutex };
    m_FileStream.open(file_name_buffer);
}
