#include <execd/kernel/node_kernel.hpp>

namespace execd {

namespace {

const char* kNodeDriver = R"JS(
'use strict';
const fs = require('fs');
const vm = require('vm');
const util = require('util');
const readline = require('readline');

globalThis.require = require;

// SIGINT outside a running cell must not kill the kernel
process.on('SIGINT', () => {});
process.on('uncaughtException', (err) => {
  process.stderr.write(String((err && err.stack) || err) + '\n');
});
process.on('unhandledRejection', (err) => {
  process.stderr.write('Unhandled rejection: ' + String((err && err.stack) || err) + '\n');
});

function send(frame) {
  fs.writeSync(3, JSON.stringify(frame) + '\n');
}

function failure(err) {
  if (err instanceof Error) {
    return {type: 'done', status: 'error', ename: err.name || 'Error',
            evalue: err.message || '', traceback: String(err.stack || '').split('\n')};
  }
  return {type: 'done', status: 'error', ename: 'Thrown', evalue: util.inspect(err), traceback: []};
}

async function run(code) {
  let value;
  try {
    value = vm.runInThisContext(code, {filename: '<cell>', breakOnSigint: true});
    if (value && typeof value.then === 'function') {
      value = await value;
    }
  } catch (err) {
    return failure(err);
  }
  const reply = {type: 'done', status: 'ok'};
  if (value !== undefined) {
    reply.result = {'text/plain': util.inspect(value)};
  }
  return reply;
}

const rl = readline.createInterface({input: fs.createReadStream(null, {fd: 4}), crlfDelay: Infinity});
let chain = Promise.resolve();

rl.on('line', (line) => {
  let msg;
  try {
    msg = JSON.parse(line);
  } catch (err) {
    return;
  }
  if (msg.type === 'shutdown') {
    process.exit(0);
  }
  chain = chain.then(() => run(msg.code || '')).then(send, (err) => send(failure(err)));
});
rl.on('close', () => process.exit(0));

send({type: 'ready', language: 'javascript', version: process.version});
)JS";

} // anonymous namespace

NodeKernel::NodeKernel(const std::string& binary)
    : binary_(binary.empty() ? std::string("node") : binary)
{
}

std::vector<std::string> NodeKernel::command_line() const {
    std::vector<std::string> argv;
    argv.push_back(binary_);
    argv.push_back("-e");
    argv.push_back(kNodeDriver);
    return argv;
}

} // namespace execd
