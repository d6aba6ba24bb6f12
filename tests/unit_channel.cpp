// unit_channel.cpp - bounded channel behavior: backpressure, closure, hang-up

#include "docsync/channel.hpp"
#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <thread>
#include <vector>

using namespace docsync;

static void test_fifo_and_close(){
    auto [tx, rx] = make_channel<int>(8);
    for(int i=0;i<5;++i){ bool ok = tx.send(i); assert(ok); }
    tx.reset();
    for(int i=0;i<5;++i){ auto v = rx.recv(); assert(v && *v==i); }
    assert(!rx.recv()); // closed and drained
    assert(!rx.recv());
}

static void test_backpressure(){
    auto [tx, rx] = make_channel<int>(2);
    std::atomic<int> sent{0};
    std::thread producer([&, tx = std::move(tx)]() mutable {
        for(int i=0;i<10;++i){ if(!tx.send(i)) return; ++sent; }
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    assert(sent.load()==2);        // blocked on the third value
    assert(rx.size()==rx.capacity());
    int expected=0;
    while(auto v = rx.recv()){ assert(*v==expected); ++expected; }
    producer.join();
    assert(expected==10 && sent.load()==10);
}

static void test_multiple_producers(){
    auto [tx, rx] = make_channel<int>(4);
    std::vector<std::thread> producers;
    for(int p=0;p<3;++p){
        producers.emplace_back([s = tx]() mutable { for(int i=0;i<100;++i){ bool ok = s.send(1); assert(ok); } });
    }
    tx.reset(); // only the copies held by the producers remain
    long total=0;
    while(auto v = rx.recv()) total += *v;
    for(auto &t: producers) t.join();
    assert(total==300);
}

static void test_receiver_hang_up_releases_blocked_sender(){
    auto channel = make_channel<int>(1);
    auto &tx = channel.first; auto &rx = channel.second;
    bool first = tx.send(1);
    assert(first);
    std::atomic<bool> result{true};
    std::thread producer([&]{ result = tx.send(2); });
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    rx.close();
    producer.join();
    assert(!result.load());
    assert(!tx.send(3));
    assert(!rx.recv());
}

int main(){
    test_fifo_and_close();
    test_backpressure();
    test_multiple_producers();
    test_receiver_hang_up_releases_blocked_sender();
    std::cout << "Channel tests passed" << std::endl;
    return 0;
}
