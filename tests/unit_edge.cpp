#include "docsync/sync.hpp"
#include <cassert>
#include <fcntl.h>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <random>
#include <sstream>
#include <stdexcept>
#include <system_error>

using namespace docsync;
namespace fs = std::filesystem;

static fs::path make_temp_dir(const std::string &name){
    fs::path p = fs::path("unit_tmp")/name;
    fs::remove_all(p); fs::create_directories(p); return fs::absolute(p);
}
static void write_file(const fs::path &p, std::string_view data){ fs::create_directories(p.parent_path()); std::ofstream o(p, std::ios::binary); o<<data; }
static std::string read_file(const fs::path &p){ std::ifstream i(p, std::ios::binary); return std::string((std::istreambuf_iterator<char>(i)),{}); }

static void test_extension_matching(){
    ExtensionSet exts = default_extensions();
    assert(has_recognized_extension("/x/a.epub", exts));
    assert(has_recognized_extension("/x/b.pdf", exts));
    assert(!has_recognized_extension("/x/c.txt", exts));
    assert(!has_recognized_extension("/x/A.EPUB", exts)); // case-sensitive
    assert(!has_recognized_extension("/x/epub", exts));
    assert(!has_recognized_extension("/x/trailing.", exts));
    assert(!has_recognized_extension("/x/.pdf", exts)); // dotfile, no extension
    assert(has_recognized_extension("/x/archive.tar.pdf", exts));
}

static void test_labels_and_summary(){
    assert(join_labels({"/a"})=="/a");
    assert(join_labels({"/a","/b","/c"})=="/a and /b and /c");
    RunSummary s; s.found=3; s.skipped=1; s.copied=2; s.source_dirs={"/docs","/desk"};
    assert(format_summary(s)==
        "\nFound documents in documents directory at /docs and /desk: 3\n"
        "Documents not copied because they already exist at the destination: 1\n"
        "Documents copied: 2");
}

static void test_path_text_rejects_invalid_utf8(){
    assert(path_text("/tmp/пример.epub")=="/tmp/пример.epub");
    bool threw=false;
    try { (void)path_text(fs::path(std::string("/tmp/bad\xff.epub"))); } catch(const std::runtime_error &){ threw=true; }
    assert(threw);
    threw=false;
    try { (void)path_text(fs::path(std::string("/tmp/overlong\xc0\xaf.pdf"))); } catch(const std::runtime_error &){ threw=true; }
    assert(threw);
}

static void test_same_name_in_two_sources(bool dry_run){
    auto s1 = make_temp_dir(dry_run?"race_dry_src1":"race_src1");
    auto s2 = make_temp_dir(dry_run?"race_dry_src2":"race_src2");
    auto dst = make_temp_dir(dry_run?"race_dry_dst":"race_dst");
    write_file(s1/"same.epub","first");
    write_file(s2/"same.epub","second");
    SyncConfig c; c.source_dirs={s1,s2}; c.dest_dir=dst; c.options.dry_run=dry_run; c.options.threads=4;
    std::ostringstream out, err;
    auto s = run_sync(c, out, err);
    assert(s.found==2 && s.copied==1 && s.skipped==1);
    if(dry_run) assert(!fs::exists(dst/"same.epub"));
    else { auto body = read_file(dst/"same.epub"); assert(body=="first" || body=="second"); }
    assert(out.str().find(" and ")!=std::string::npos);
}

static void test_empty_and_large_files(){
    auto src = make_temp_dir("sizes_src");
    write_file(src/"empty.pdf","");
    std::mt19937_64 rng(12345);
    std::string data; data.resize(3*1024*1024 + 17);
    for(char &c: data) c = static_cast<char>(rng() & 0xFF);
    write_file(src/"big.epub",data);
    auto dst = make_temp_dir("sizes_dst");
    SyncConfig c; c.source_dirs={src}; c.dest_dir=dst;
    std::ostringstream out, err;
    auto s = run_sync(c, out, err);
    assert(s.copied==2);
    assert(fs::file_size(dst/"empty.pdf")==0);
    assert(read_file(dst/"big.epub")==data);
}

static void test_custom_extensions_and_symlinks(){
    auto src = make_temp_dir("custom_src");
    auto outside = make_temp_dir("custom_outside");
    write_file(src/"a.mobi","m");
    write_file(src/"b.epub","e");
    write_file(outside/"c.mobi","hidden");
    fs::create_directory_symlink(outside, src/"link");
    fs::create_directories(src/"folder.mobi"); // directories never match
    auto dst = make_temp_dir("custom_dst");
    SyncConfig c; c.source_dirs={src}; c.dest_dir=dst; c.extensions={"mobi"};
    std::ostringstream out, err;
    auto s = run_sync(c, out, err);
    assert(s.found==1 && s.copied==1);
    assert(fs::exists(dst/"a.mobi") && !fs::exists(dst/"b.epub") && !fs::exists(dst/"c.mobi"));
}

static void test_missing_source_aborts_without_summary(){
    auto dst = make_temp_dir("missing_dst");
    SyncConfig c; c.source_dirs={fs::path("unit_tmp")/"does_not_exist"}; c.dest_dir=dst;
    std::ostringstream out, err;
    bool threw=false;
    try { run_sync(c, out, err); } catch(const fs::filesystem_error &){ threw=true; }
    assert(threw);
    assert(out.str().find("Documents copied")==std::string::npos);
}

static void test_unwritable_destination_aborts(){
    // More candidates than the channel holds, so the scanner is blocked when the coordinator fails.
    auto src = make_temp_dir("nodest_src");
    for(int i=0;i<400;++i) write_file(src/("f"+std::to_string(i)+".pdf"),"x");
    SyncConfig c; c.source_dirs={src}; c.dest_dir=fs::absolute("unit_tmp")/"no_such_dest";
    fs::remove_all(c.dest_dir);
    std::ostringstream out, err;
    bool threw=false;
    try { run_sync(c, out, err); }
    catch(const std::system_error &e){ threw=true; assert(e.code()==std::errc::no_such_file_or_directory); }
    assert(threw);
    assert(out.str().find("Documents copied")==std::string::npos);
}

static void test_failed_copy_removes_partial_file(){
    auto d = make_temp_dir("copy_fail");
    auto dest = d/"out.pdf";
    UniqueFd fd(::open(dest.c_str(), O_WRONLY | O_CREAT | O_EXCL, 0644));
    assert(fd);
    std::ostringstream out, err;
    Console console(out, err);
    bool threw=false;
    try { copy_document(d/"missing.pdf", dest, std::move(fd), console); } catch(const std::system_error &){ threw=true; }
    assert(threw);
    assert(!fs::exists(dest));
    assert(out.str().empty());
}

static void test_coordinator_waits_for_all_tasks(){
    auto src = make_temp_dir("join_src");
    auto dst = make_temp_dir("join_dst");
    write_file(src/"ok1.pdf","1");
    write_file(src/"ok2.pdf","2");
    auto [cand_tx, cand_rx] = make_channel<fs::path>(4);
    auto [stat_tx, stat_rx] = make_channel<Statistic>(16);
    bool sent = cand_tx.send(src/"missing.pdf"); // created at dest, then the copy fails
    sent = cand_tx.send(src/"ok1.pdf") && sent;
    sent = cand_tx.send(src/"ok2.pdf") && sent;
    assert(sent);
    cand_tx.reset();
    std::ostringstream out, err;
    Console console(out, err);
    CopyExecutor executor(2);
    bool threw=false;
    try { sync_documents(dst, SyncOptions{}, cand_rx, stat_tx, executor, console); } catch(const std::system_error &){ threw=true; }
    assert(threw);
    // later tasks still ran to completion
    assert(read_file(dst/"ok1.pdf")=="1" && read_file(dst/"ok2.pdf")=="2");
    assert(!fs::exists(dst/"missing.pdf"));
    stat_tx.reset();
    int copied=0; while(auto st = stat_rx.recv()) if(*st==Statistic::copied) ++copied;
    assert(copied==3);
}

int main(){
    test_extension_matching();
    test_labels_and_summary();
    test_path_text_rejects_invalid_utf8();
    test_same_name_in_two_sources(false);
    test_same_name_in_two_sources(true);
    test_empty_and_large_files();
    test_custom_extensions_and_symlinks();
    test_missing_source_aborts_without_summary();
    test_unwritable_destination_aborts();
    test_failed_copy_removes_partial_file();
    test_coordinator_waits_for_all_tasks();
    std::cout << "All edge tests passed" << std::endl;
    return 0;
}
