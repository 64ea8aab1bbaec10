/**
 * @file mini_wordnet.hpp
 * @brief Tiny WordNet 3.0 dict/ directory and SentiWordNet file written to a temp directory
 *
 * Concepts (visitation order):
 *   entity, physical_entity, abstraction, event, person, layoff, manager, thing   (nouns)
 *   fire (second sense of "fire")                                                 (verb)
 *   happy <-> unhappy antonyms, fired (satellite), galore(ip)                     (adjectives)
 *   quickly                                                                       (adverb)
 */

#pragma once

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <unistd.h>

namespace LexicodeTest {

class MiniWordNet {
public:
    explicit MiniWordNet(const std::string& tag) {
        dir_ = std::filesystem::temp_directory_path() /
               ("lexicode_" + tag + "_" + std::to_string(static_cast<long>(::getpid())));
        std::filesystem::remove_all(dir_);
        std::filesystem::create_directories(dir_);
        write_all();
    }

    ~MiniWordNet() {
        std::error_code ec;
        std::filesystem::remove_all(dir_, ec);
    }

    MiniWordNet(const MiniWordNet&) = delete;
    MiniWordNet& operator=(const MiniWordNet&) = delete;

    std::string dict_dir() const { return dir_.string(); }
    std::string sentiwordnet_path() const { return (dir_ / "SentiWordNet_3.0.0.txt").string(); }
    std::string path(const std::string& name) const { return (dir_ / name).string(); }

    void write(const std::string& name, const std::string& content) const {
        std::ofstream out(dir_ / name);
        if (!out) throw std::runtime_error("cannot write fixture " + name);
        out << content;
    }

    void remove(const std::string& name) const {
        std::filesystem::remove(dir_ / name);
    }

private:
    void write_all() const {
        write("index.noun",
              "  1 This software and database is being provided to you, the LICENSEE\n"
              "abstraction n 6 1 @ 6 0 09000001 09000002 09000003 09000004 09000005 00000003\n"
              "entity n 1 1 ~ 1 0 00000001\n"
              "event n 1 2 @ ~ 1 0 00000004\n"
              "individual n 1 1 @ 1 0 00000005\n"
              "layoff n 1 1 @ 1 1 00000006\n"
              "man n 1 1 @ 1 0 09000010\n"
              "manager n 1 1 @ 1 0 00000007\n"
              "person n 1 1 @ 1 1 00000005\n"
              "physical_entity n 1 2 @ ~ 1 0 00000002\n"
              "redundancy n 1 1 @ 1 1 00000006\n"
              "thing n 1 0 1 0 00000008\n");
        write("data.noun",
              "  1 This software and database is being provided to you, the LICENSEE\n"
              "00000001 03 n 01 entity 0 000 | that which is perceived to have its own distinct existence\n"
              "00000002 03 n 01 physical_entity 0 001 @ 00000001 n 0000 | an entity that has physical existence\n"
              "00000003 03 n 01 abstraction 0 001 @ 00000001 n 0000 | a general concept\n"
              "00000004 03 n 01 event 0 001 @ 00000003 n 0000 | something that happens at a given place and time\n"
              "00000005 03 n 02 person 0 individual 0 001 @ 00000002 n 0000 | a human being\n"
              "00000006 04 n 02 layoff 0 redundancy 0 001 @ 00000004 n 0000 | the act of laying off an employee\n"
              "00000007 18 n 01 manager 0 001 @ 00000005 n 0000 | someone who controls resources\n"
              "00000008 03 n 01 thing 0 000 | a separate and self-contained entity\n");
        write("noun.exc", "men man\n");

        write("index.verb", "fire v 2 1 @ 2 0 00000102 00000101\n"
                            "sack v 1 1 @ 1 0 00000101\n");
        write("data.verb", "00000101 41 v 02 fire 0 sack 0 000 | terminate the employment of\n");

        write("index.adj",
              "fired a 1 0 1 0 00000203\n"
              "galore a 1 0 1 0 00000204\n"
              "happy a 1 1 ! 1 1 00000201\n"
              "unhappy a 1 1 ! 1 0 00000202\n");
        write("data.adj",
              "00000201 00 a 01 happy 0 001 ! 00000202 a 0101 | enjoying or showing well-being\n"
              "00000202 00 a 01 unhappy 0 001 ! 00000201 a 0101 | experiencing or marked by sorrow\n"
              "00000203 00 s 01 fired 0 000 | hardened by heat\n"
              "00000204 00 a 01 galore(ip) 0 000 | in great numbers\n");

        write("index.adv", "quickly r 1 0 1 0 00000301\n");
        write("data.adv", "00000301 02 r 01 quickly 0 000 | with rapid movements\n");

        write("index.sense",
              "happy%3:00:00:: 00000201 1 40\n"
              "layoff%1:04:00:: 00000006 1 3\n"
              "person%1:03:00:: 00000005 1 12\n"
              "redundancy%1:04:00:: 00000006 2 1\n");

        write("SentiWordNet_3.0.0.txt",
              "# SentiWordNet v3.0.0\n"
              "# POS\tID\tPosScore\tNegScore\tSynsetTerms\tGloss\n"
              "n\t00000006\t0.05\t0.40\tlayoff#1 redundancy#2\tthe act of laying off an employee\n"
              "n\t00000005\t0\t0\tperson#1 individual#1\ta human being\n"
              "v\t00000101\t0\t0.375\tfire#2 sack#1\tterminate the employment of\n"
              "a\t00000201\t0.75\t0\thappy#1\tenjoying or showing well-being\n"
              "a\t00000202\t0\t0\tunhappy#1\texperiencing or marked by sorrow\n"
              "s\t00000203\t0.5\t0\tfired#1\thardened by heat\n"
              "r\t00000301\t0\t0\tquickly#1\twith rapid movements\n"
              "\t\t\t\t\t\n");
    }

    std::filesystem::path dir_;
};

} // namespace LexicodeTest
