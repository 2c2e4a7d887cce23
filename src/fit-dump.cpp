#include "LinuxUtil.h"
#include "FitFile.h"

#include <unistd.h>
#include <iostream>
#include <sstream>

using namespace FitDecode;

namespace {

/** Prints every data message of a FIT file, one line per message. */
class DumpBuilder : public fit::FitBuilder
{
public:
    DumpBuilder(std::ostream &o)
        : m_Out(o), m_Files(0), m_Messages(0), m_Unresolved(0)
    {
    }

    void OnFileHeader(const fit::FileHeader &h) override
    {
        m_Files++;
        m_Out << h << "\n";
    }

    void OnMessage(const fit::FitMessage &m) override
    {
        m_Messages++;
        if (m.Timestamp.isNA())
            m_Out << "-";
        else
            m_Out << m.Timestamp.value << " (" << fit::FitTimeToUnix(m.Timestamp) << ")";
        m_Out << " global: " << m.GlobalNumber
              << " local: " << (int)m.LocalType;
        if (! m.MessageIndex.isNA())
            m_Out << " index: " << m.MessageIndex.value;
        for (const auto &f : m.Fields) {
            m_Out << " ";
            if (f.IsDeveloperField()) {
                m_Out << "dev" << (int)f.DeveloperDataIndex() << ":";
                if (f.IsUnresolved())
                    m_Unresolved++;
            }
            m_Out << (int)f.FieldNumber() << "=" << f;
        }
        m_Out << "\n";
    }

    void OnFieldDescription(const fit::DeveloperFieldMeta &meta) override
    {
        m_Out << meta << "\n";
    }

    int Files() const { return m_Files; }
    int Messages() const { return m_Messages; }
    int Unresolved() const { return m_Unresolved; }

private:
    std::ostream &m_Out;
    int m_Files;
    int m_Messages;
    int m_Unresolved;
};

bool DumpFitFile(const std::string &path, const fit::ReaderOptions &options)
{
    DumpBuilder b(std::cout);
    try {
        FileSource src(path);
        std::cout << path << ":\n";
        fit::ReadFitMessages(src, &b, options);
        std::cout << path << ": " << b.Files() << " file(s), "
                  << b.Messages() << " message(s)";
        if (b.Unresolved() > 0)
            std::cout << ", " << b.Unresolved() << " unresolved developer field(s)";
        std::cout << "\n";
        return true;
    }
    catch (const std::exception &e) {
        std::cout << std::flush;
        std::cerr << path << ": " << e.what()
                  << " (after " << b.Messages() << " message(s))\n";
        return false;
    }
}

};                                      // end anonymous namespace

int main(int argc, char **argv)
{
    fit::ReaderOptions options;

    int opt = 0;
    while ((opt = getopt(argc, argv, "vsh")) != -1) {
        switch (opt) {
        case 'v':
            options.Verbose = true;
            break;
        case 's':
            options.FollowChainedFiles = false;
            break;
        case 'h':
            std::cerr << "Usage: " << argv[0] << " [-v] [-s] FILE...\n"
                      << "  -v  log message definitions and bad records\n"
                      << "  -s  stop after the first FIT file in each input\n";
            return 1;
            break;
        default:
            std::cerr << "Bad option: " << (char)optopt << "\n";
            return 1;
            break;
        }
    }

    if (optind >= argc) {
        std::cerr << "Missing file name\n";
        return 1;
    }

    int failed = 0;
    for (int i = optind; i < argc; ++i) {
        if (! DumpFitFile(argv[i], options))
            failed++;
    }

    return failed > 0 ? 1 : 0;
}
