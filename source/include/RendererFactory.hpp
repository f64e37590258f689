#pragma once

#include "Renderer.hpp"
#include "StatusStore.hpp"
#include "ShutdownSignal.hpp"

#include <chrono>
#include <memory>

#include <boost/asio.hpp>

enum class RendererKind { Console, Interactive };

// Interactive falls back to Console when stdout is not a terminal.
std::unique_ptr<Renderer> make_renderer(RendererKind kind,
                                        boost::asio::any_io_executor exec,
                                        const StatusStore& store,
                                        ShutdownSignal& shutdown,
                                        std::chrono::seconds delay,
                                        std::chrono::milliseconds refresh);
